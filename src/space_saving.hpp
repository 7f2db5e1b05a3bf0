#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <cstddef>

/// SpaceSaving: memory-bounded approximate heavy hitters (Metwally et al.)
/// - Capacity bounds the number of tracked keys.
/// - update(key, cnt) processes one (or cnt) occurrences.
/// - topk(k) returns the k largest approximate counts, descending.
///
/// Not internally synchronized: one writer at a time, see Aggregator.
class SpaceSaving {
public:
    // throws std::invalid_argument if capacity == 0
    explicit SpaceSaving(size_t capacity = 256);
    ~SpaceSaving();

    SpaceSaving(const SpaceSaving&) = delete;
    SpaceSaving& operator=(const SpaceSaving&) = delete;

    void update(const std::string &key, uint64_t cnt = 1);

    std::vector<std::pair<std::string, uint64_t>> topk(size_t k) const;

    // Approximate count for a key (0 if not tracked). Overestimates by at most error(key).
    uint64_t estimate(const std::string &key) const;
    uint64_t error(const std::string &key) const;

    size_t get_capacity() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
