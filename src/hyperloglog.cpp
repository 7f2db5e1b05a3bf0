#include "hyperloglog.hpp"
#include "hash.hpp"
#include <cmath>
#include <stdexcept>

HyperLogLog::HyperLogLog(uint8_t precision, uint64_t seed)
    : p_(precision), seed_(splitmix64(seed))
{
    if (precision < 4 || precision > 18)
        throw std::invalid_argument("HyperLogLog: precision must be in [4,18]");
    registers_.assign(size_t(1) << p_, 0);
}

void HyperLogLog::add(const std::string &key) {
    uint64_t h = hash64(key, seed_);
    size_t idx = static_cast<size_t>(h >> (64 - p_));
    uint64_t rest = h << p_;
    // rank = position of the first 1-bit in the remaining 64-p bits
    uint8_t rank = 1;
    const uint8_t max_rank = static_cast<uint8_t>(64 - p_ + 1);
    while (rank < max_rank && (rest & (1ULL << 63)) == 0) {
        rest <<= 1;
        ++rank;
    }
    if (rank > registers_[idx]) registers_[idx] = rank;
}

double HyperLogLog::estimate() const {
    const double m = static_cast<double>(registers_.size());
    double alpha;
    if (registers_.size() == 16) alpha = 0.673;
    else if (registers_.size() == 32) alpha = 0.697;
    else if (registers_.size() == 64) alpha = 0.709;
    else alpha = 0.7213 / (1.0 + 1.079 / m);

    double z = 0.0;
    size_t zeros = 0;
    for (uint8_t r : registers_) {
        z += std::ldexp(1.0, -static_cast<int>(r));
        if (r == 0) ++zeros;
    }
    double e = alpha * m * m / z;
    // small-range correction: linear counting
    if (e <= 2.5 * m && zeros > 0) {
        e = m * std::log(m / static_cast<double>(zeros));
    }
    return e;
}
