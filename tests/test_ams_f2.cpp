// tests/test_ams_f2.cpp
// sketch header first: it must stand on its own includes
#include "../src/ams_f2.hpp"
#include <iostream>
#include <map>
#include <cmath>
#include <stdexcept>

int main() {
    bool threw = false;
    try { AmsF2Sketch bad(0); } catch (const std::invalid_argument &) { threw = true; }
    if (!threw) {
        std::cerr << "ams: k = 0 accepted\n";
        return 1;
    }

    // one distinct value: every accumulator is +-count, so the estimate is exact
    AmsF2Sketch one(10, 42);
    for (int i = 0; i < 5; i++) one.update(7);
    if (one.estimate() != 25.0) {
        std::cerr << "ams: single value expected 25 got " << one.estimate() << "\n";
        return 2;
    }

    // opposite weights cancel
    AmsF2Sketch cancel(16, 42);
    cancel.update(3, 4);
    cancel.update(3, -4);
    if (cancel.estimate() != 0.0) {
        std::cerr << "ams: cancelled weights left " << cancel.estimate() << "\n";
        return 3;
    }

    AmsF2Sketch sk(200, 42);
    std::map<int64_t, int64_t> counts;
    for (int64_t i = 0; i < 2000; i++) {
        int64_t v = (i * i) % 23;
        sk.update(v);
        counts[v]++;
    }
    double f2 = 0.0;
    for (auto &p : counts) f2 += static_cast<double>(p.second * p.second);
    double rel = std::fabs(sk.estimate() - f2) / f2;
    if (rel > 0.25) {
        std::cerr << "ams: estimate " << sk.estimate() << " vs F2 " << f2 << "\n";
        return 4;
    }

    // equal seeds give equal sketches
    AmsF2Sketch a(8, 5), b(8, 5);
    for (int64_t v = 0; v < 100; v++) { a.update(v % 9); b.update(v % 9); }
    if (a.accumulators() != b.accumulators()) {
        std::cerr << "ams: same seed diverged\n";
        return 5;
    }

    std::cout << "test_ams_f2: OK\n";
    return 0;
}
