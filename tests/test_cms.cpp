// tests/test_cms.cpp
#include <iostream>
#include <string>
#include <unordered_map>
#include <stdexcept>
#include "../src/cms.hpp"

int main() {
    bool threw = false;
    try { CountMinSketch bad(0, 4); } catch (const std::invalid_argument &) { threw = true; }
    if (!threw) {
        std::cerr << "cms: width 0 accepted\n";
        return 1;
    }
    threw = false;
    try { CountMinSketch bad(16, 0); } catch (const std::invalid_argument &) { threw = true; }
    if (!threw) {
        std::cerr << "cms: depth 0 accepted\n";
        return 2;
    }

    // wide table, few keys: no collisions, so estimates are exact
    CountMinSketch wide(2000, 5, 42);
    for (int i = 0; i < 10; i++) wide.add("p" + std::to_string(i), static_cast<uint64_t>(i + 1));
    for (int i = 0; i < 10; i++) {
        uint64_t est = wide.estimate("p" + std::to_string(i));
        if (est != static_cast<uint64_t>(i + 1)) {
            std::cerr << "cms: expected exact count " << (i + 1) << " got " << est << "\n";
            return 3;
        }
    }
    if (wide.estimate("absent") != 0) {
        std::cerr << "cms: absent key has nonzero estimate\n";
        return 4;
    }

    // narrow table forces collisions; still never below the true count
    CountMinSketch narrow(16, 2, 42);
    std::unordered_map<std::string, uint64_t> truth;
    for (int i = 0; i < 500; i++) {
        std::string k = "k" + std::to_string(i % 37);
        narrow.add(k);
        truth[k]++;
    }
    bool any_over = false;
    for (auto &p : truth) {
        uint64_t est = narrow.estimate(p.first);
        if (est < p.second) {
            std::cerr << "cms: underestimate for " << p.first << ": " << est << " < " << p.second << "\n";
            return 5;
        }
        if (est > p.second) any_over = true;
    }
    if (!any_over) {
        std::cerr << "cms: 37 keys in 16 columns should collide somewhere\n";
        return 6;
    }

    narrow.reset();
    if (narrow.estimate("k1") != 0) {
        std::cerr << "cms: reset left counts behind\n";
        return 7;
    }

    std::cout << "test_cms: OK\n";
    return 0;
}
