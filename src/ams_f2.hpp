#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>

// AmsF2Sketch: Alon-Matias-Szegedy estimator of the second frequency moment
// F2 = sum over values v of (net weight of v)^2.
// Each of k accumulators adds sign(value, seed_i) * weight; the estimate is
// the mean of the squared accumulators (unbiased; variance shrinks with k).
class AmsF2Sketch {
public:
    // throws std::invalid_argument if k == 0
    explicit AmsF2Sketch(size_t k = 10, uint64_t seed = 42);

    void update(int64_t value, int64_t weight = 1);
    double estimate() const;

    size_t k() const { return seeds_.size(); }
    const std::vector<int64_t> &accumulators() const { return z_; }

private:
    std::vector<uint64_t> seeds_;
    std::vector<int64_t> z_;
};
