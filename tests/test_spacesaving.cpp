// tests/test_spacesaving.cpp
// Heavy-hitter retention and the SpaceSaving error bounds.

#include <iostream>
#include <string>
#include <vector>
#include <unordered_map>
#include <stdexcept>
#include "../src/space_saving.hpp"

int main() {
    using namespace std;

    bool threw = false;
    try { SpaceSaving bad(0); } catch (const invalid_argument &) { threw = true; }
    if (!threw) {
        cerr << "SpaceSaving: capacity 0 accepted\n";
        return 1;
    }

    // capacity 3: A x100, B x60, C x30, D x10, E x5
    SpaceSaving ss(3);
    unordered_map<string, uint64_t> truth{{"A",100},{"B",60},{"C",30},{"D",10},{"E",5}};
    for (const char *k : {"A","B","C","D","E"}) {
        for (uint64_t i = 0; i < truth[k]; i++) ss.update(k, 1);
    }

    auto top3 = ss.topk(3);
    if (top3.size() != 3) {
        cerr << "SpaceSaving::topk expected 3 entries got " << top3.size() << "\n";
        return 2;
    }
    if (top3[0].first != "A" || top3[1].first != "B") {
        cerr << "Expected A then B at the top, got " << top3[0].first << ", " << top3[1].first << "\n";
        return 3;
    }
    for (size_t i = 1; i < top3.size(); i++) {
        if (top3[i].second > top3[i-1].second) {
            cerr << "topk not sorted by count\n";
            return 4;
        }
    }

    // count - error <= true <= count for every tracked key
    for (auto &p : top3) {
        uint64_t est = ss.estimate(p.first);
        uint64_t err = ss.error(p.first);
        uint64_t t = truth[p.first];
        if (est < t || est - err > t) {
            cerr << "bounds violated for " << p.first << ": est=" << est << " err=" << err << " true=" << t << "\n";
            return 5;
        }
    }

    if (ss.estimate("never") != 0 || ss.get_capacity() != 3) {
        cerr << "untracked key or capacity mismatch\n";
        return 6;
    }

    // batched weights count like repeated updates
    SpaceSaving w(8);
    w.update("x", 5);
    w.update("y", 2);
    w.update("x", 0);
    if (w.estimate("x") != 5 || w.topk(1)[0].first != "x") {
        cerr << "weighted update mismatch\n";
        return 7;
    }

    cout << "test_spacesaving: OK\n";
    return 0;
}
