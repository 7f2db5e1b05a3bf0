#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// HyperLogLog distinct counter with 2^precision one-byte registers.
// Standard error is about 1.04 / sqrt(2^precision).
class HyperLogLog {
public:
    // precision in [4, 18]; throws std::invalid_argument otherwise
    explicit HyperLogLog(uint8_t precision = 12, uint64_t seed = 42);

    void add(const std::string &key);
    double estimate() const;

    uint8_t precision() const { return p_; }
    size_t register_count() const { return registers_.size(); }

private:
    uint8_t p_;
    uint64_t seed_;
    std::vector<uint8_t> registers_;
};
