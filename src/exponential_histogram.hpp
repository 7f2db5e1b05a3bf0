#pragma once
#include <deque>
#include <cstddef>
#include <cstdint>
#include <ctime>

// ExponentialHistogram (DGIM): approximate number of 1-bits seen within the
// trailing `window_seconds`, using O(log window) buckets.
//
// Buckets are kept newest-first. Each holds the timestamp of its newest 1-bit
// and a power-of-two size; at most two buckets share a size. query() counts
// every live bucket in full except the oldest, which contributes half its size,
// so the estimate is within 50% of the true window sum.
class ExponentialHistogram {
public:
    struct Bucket {
        std::time_t ts;
        uint64_t size;
    };

    // throws std::invalid_argument if window_seconds <= 0
    explicit ExponentialHistogram(std::time_t window_seconds = 300);

    void add_bit(bool bit, std::time_t ts);

    // Approximate count of 1-bits with timestamp >= now - window.
    // Expired buckets are skipped here and dropped by the next add_bit/expire.
    uint64_t query(std::time_t now) const;

    // Drop buckets older than now - window.
    void expire(std::time_t now);

    size_t bucket_count() const { return buckets_.size(); }
    const std::deque<Bucket> &buckets() const { return buckets_; }
    std::time_t window() const { return window_; }

private:
    std::time_t window_;
    std::deque<Bucket> buckets_;

    void merge_triples();
};
