#pragma once
#include <string>
#include <vector>
#include <queue>
#include <unordered_set>
#include <cstdint>
#include <cstddef>

// MinHashSampler: keeps the k distinct items with the smallest 64-bit hash.
// The retained set is a uniform-ish sample of every distinct item considered,
// independent of arrival order and stream length, in O(k) memory.
//
// Ties: an item replaces the current maximum only on a strictly smaller hash,
// so on equal hashes the entry already held is kept.
class MinHashSampler {
public:
    // throws std::invalid_argument if k == 0
    explicit MinHashSampler(size_t k = 200, uint64_t seed = 42);

    void consider(const std::string &item);

    // Held items, unordered, size <= k.
    std::vector<std::string> sample() const;

    uint64_t hash_item(const std::string &item) const;

    size_t size() const { return heap_.size(); }
    size_t capacity() const { return k_; }
    uint64_t max_held_hash() const;

private:
    using HeapItem = std::pair<uint64_t, std::string>;

    // Compare on hash only so equal hashes never reorder by item text.
    struct ByHash {
        bool operator()(const HeapItem &a, const HeapItem &b) const { return a.first < b.first; }
    };

    size_t k_;
    uint64_t seed_;
    std::priority_queue<HeapItem, std::vector<HeapItem>, ByHash> heap_; // max-heap by hash
    std::unordered_set<uint64_t> held_;
};
