// src/cms.cpp
#include "cms.hpp"
#include "hash.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

CountMinSketch::CountMinSketch(size_t w, size_t d, uint64_t seed)
    : width(w), depth(d)
{
    if (width == 0 || depth == 0)
        throw std::invalid_argument("CountMinSketch: width and depth must be >= 1");
    table.assign(depth, std::vector<uint64_t>(width, 0));
    seeds = derive_seeds(seed, depth);
}

size_t CountMinSketch::column(const std::string &key, size_t row) const {
    return static_cast<size_t>(hash64(key, seeds[row]) % width);
}

void CountMinSketch::add(const std::string &key, uint64_t count) {
    for (size_t r = 0; r < depth; r++) {
        table[r][column(key, r)] += count;
    }
}

uint64_t CountMinSketch::estimate(const std::string &key) const {
    uint64_t best = std::numeric_limits<uint64_t>::max();
    for (size_t r = 0; r < depth; r++) {
        best = std::min(best, table[r][column(key, r)]);
    }
    return best;
}

void CountMinSketch::reset() {
    for (auto &row : table) std::fill(row.begin(), row.end(), 0);
}
