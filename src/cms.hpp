// src/cms.hpp
#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

// Count-Min Sketch: depth rows of width counters, one derived seed per row.
// estimate() never undercounts; it overcounts only through column collisions.
class CountMinSketch {
public:
    // throws std::invalid_argument if width or depth is 0
    CountMinSketch(size_t width = 2000, size_t depth = 5, uint64_t seed = 42);

    void add(const std::string &key, uint64_t count = 1);
    uint64_t estimate(const std::string &key) const;
    void reset();

    size_t get_width() const { return width; }
    size_t get_depth() const { return depth; }

private:
    size_t width;
    size_t depth;
    std::vector<std::vector<uint64_t>> table;
    std::vector<uint64_t> seeds;

    size_t column(const std::string &key, size_t row) const;
};
