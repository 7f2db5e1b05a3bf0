#include "exponential_histogram.hpp"
#include <stdexcept>

ExponentialHistogram::ExponentialHistogram(std::time_t window_seconds)
    : window_(window_seconds)
{
    if (window_ <= 0) throw std::invalid_argument("ExponentialHistogram: window must be >= 1 second");
}

void ExponentialHistogram::add_bit(bool bit, std::time_t ts) {
    if (bit) {
        buckets_.push_front(Bucket{ts, 1});
        merge_triples();
    }
    expire(ts);
}

// Whenever three consecutive buckets share a size, fold the two oldest into
// one bucket of double size stamped with the newer of the two timestamps.
// A merge can only create a new triple further towards the old end, so a
// single forward scan settles the invariant.
void ExponentialHistogram::merge_triples() {
    size_t i = 0;
    while (i + 2 < buckets_.size()) {
        if (buckets_[i].size == buckets_[i + 1].size &&
            buckets_[i + 1].size == buckets_[i + 2].size) {
            buckets_[i + 1].size *= 2;
            buckets_.erase(buckets_.begin() + static_cast<std::ptrdiff_t>(i + 2));
        }
        ++i;
    }
}

void ExponentialHistogram::expire(std::time_t now) {
    const std::time_t cutoff = now - window_;
    while (!buckets_.empty() && buckets_.back().ts < cutoff) {
        buckets_.pop_back();
    }
}

uint64_t ExponentialHistogram::query(std::time_t now) const {
    const std::time_t cutoff = now - window_;
    uint64_t total = 0;
    uint64_t oldest = 0;
    for (const auto &b : buckets_) {
        if (b.ts < cutoff) break;
        total += b.size;
        oldest = b.size;
    }
    return total - oldest / 2;
}
