#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// BloomFilter: probabilistic set membership, no removal.
// Sized at construction for `capacity` keys at `error_rate` false positives.
// contains() never returns false for an inserted key.
class BloomFilter {
public:
    // throws std::invalid_argument on capacity == 0 or error_rate outside (0,1)
    BloomFilter(size_t capacity = 10000, double error_rate = 0.001, uint64_t seed = 42);

    void insert(const std::string &key);
    bool contains(const std::string &key) const;

    size_t bit_count() const { return num_bits_; }
    size_t hash_count() const { return seeds_.size(); }
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    size_t num_bits_;
    std::vector<uint64_t> words_;
    std::vector<uint64_t> seeds_;
};
