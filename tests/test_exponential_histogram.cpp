// tests/test_exponential_histogram.cpp
#include <iostream>
#include <map>
#include <cstdint>
#include <stdexcept>
#include "../src/exponential_histogram.hpp"

// at most two buckets per size; sizes are powers of two growing towards the old end
static bool well_formed(const ExponentialHistogram &eh) {
    std::map<uint64_t, int> per_size;
    uint64_t prev = 0;
    for (const auto &b : eh.buckets()) {
        if (b.size == 0 || (b.size & (b.size - 1)) != 0) return false;
        if (b.size < prev) return false;
        prev = b.size;
        if (++per_size[b.size] > 2) return false;
    }
    return true;
}

int main() {
    bool threw = false;
    try { ExponentialHistogram bad(0); } catch (const std::invalid_argument &) { threw = true; }
    if (!threw) {
        std::cerr << "eh: zero window accepted\n";
        return 1;
    }

    // 8 ones, all inside a 10 s window
    ExponentialHistogram eh(10);
    for (std::time_t t = 1; t <= 8; t++) eh.add_bit(true, t);
    if (!well_formed(eh)) {
        std::cerr << "eh: bucket invariant broken\n";
        return 2;
    }
    uint64_t est = eh.query(8);
    if (est < 4 || est > 12) {
        std::cerr << "eh: estimate " << est << " outside 50% of 8\n";
        return 3;
    }

    // everything has aged out
    if (eh.query(8 + 10 + 1) != 0) {
        std::cerr << "eh: expired buckets still counted\n";
        return 4;
    }

    // zero bits add nothing
    ExponentialHistogram zeros(10);
    for (std::time_t t = 0; t < 50; t++) zeros.add_bit(false, t);
    if (zeros.bucket_count() != 0 || zeros.query(50) != 0) {
        std::cerr << "eh: zero bits created buckets\n";
        return 5;
    }

    // long stream through a 100 s window: error bound holds at every step
    ExponentialHistogram w(100);
    for (std::time_t t = 0; t < 3000; t++) {
        w.add_bit(true, t);
        uint64_t truth = static_cast<uint64_t>(t < 100 ? t + 1 : 101);
        uint64_t q = w.query(t);
        uint64_t diff = q > truth ? q - truth : truth - q;
        if (2 * diff > truth) {
            std::cerr << "eh: at t=" << t << " estimate " << q << " vs true " << truth << "\n";
            return 6;
        }
        if (!well_formed(w)) {
            std::cerr << "eh: invariant broken at t=" << t << "\n";
            return 7;
        }
    }
    if (w.bucket_count() > 16) {
        std::cerr << "eh: bucket count should stay logarithmic, got " << w.bucket_count() << "\n";
        return 8;
    }

    // no eviction: buckets hold exactly the number of ones
    ExponentialHistogram big(1000000);
    for (std::time_t t = 0; t < 1000; t++) big.add_bit(true, t);
    uint64_t total = 0;
    for (const auto &b : big.buckets()) total += b.size;
    if (total != 1000) {
        std::cerr << "eh: bucket sizes sum to " << total << " not 1000\n";
        return 9;
    }

    std::cout << "test_exponential_histogram: OK\n";
    return 0;
}
