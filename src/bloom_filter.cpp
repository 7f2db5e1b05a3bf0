#include "bloom_filter.hpp"
#include "hash.hpp"
#include <cmath>
#include <stdexcept>

BloomFilter::BloomFilter(size_t capacity, double error_rate, uint64_t seed)
    : capacity_(capacity)
{
    if (capacity == 0)
        throw std::invalid_argument("BloomFilter: capacity must be >= 1");
    if (!(error_rate > 0.0 && error_rate < 1.0))
        throw std::invalid_argument("BloomFilter: error_rate must be in (0,1)");

    const double ln2 = std::log(2.0);
    double m = -static_cast<double>(capacity) * std::log(error_rate) / (ln2 * ln2);
    num_bits_ = static_cast<size_t>(std::ceil(m));
    if (num_bits_ < 64) num_bits_ = 64;

    long k = std::lround(static_cast<double>(num_bits_) / static_cast<double>(capacity) * ln2);
    if (k < 1) k = 1;

    words_.assign((num_bits_ + 63) / 64, 0);
    seeds_ = derive_seeds(seed, static_cast<size_t>(k));
}

void BloomFilter::insert(const std::string &key) {
    for (uint64_t s : seeds_) {
        size_t bit = static_cast<size_t>(hash64(key, s) % num_bits_);
        words_[bit >> 6] |= (1ULL << (bit & 63));
    }
}

bool BloomFilter::contains(const std::string &key) const {
    for (uint64_t s : seeds_) {
        size_t bit = static_cast<size_t>(hash64(key, s) % num_bits_);
        if ((words_[bit >> 6] & (1ULL << (bit & 63))) == 0) return false;
    }
    return true;
}
