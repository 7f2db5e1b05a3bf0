#include "ams_f2.hpp"
#include "hash.hpp"
#include <stdexcept>

AmsF2Sketch::AmsF2Sketch(size_t k, uint64_t seed) {
    if (k == 0) throw std::invalid_argument("AmsF2Sketch: k must be >= 1");
    seeds_ = derive_seeds(seed, k);
    z_.assign(k, 0);
}

void AmsF2Sketch::update(int64_t value, int64_t weight) {
    for (size_t i = 0; i < seeds_.size(); i++) {
        int64_t sign = (hash64(value, seeds_[i]) & 1ULL) ? -1 : 1;
        z_[i] += sign * weight;
    }
}

double AmsF2Sketch::estimate() const {
    double sum = 0.0;
    for (int64_t z : z_) {
        double d = static_cast<double>(z);
        sum += d * d;
    }
    return sum / static_cast<double>(z_.size());
}
