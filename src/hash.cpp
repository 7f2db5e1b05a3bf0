#include "hash.hpp"

uint64_t splitmix64(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

std::vector<uint64_t> derive_seeds(uint64_t seed, size_t n) {
    std::vector<uint64_t> out(n);
    uint64_t s = seed;
    for (size_t i = 0; i < n; i++) {
        s = splitmix64(s + i + 0x9e3779b97f4a7c15ULL);
        out[i] = s;
    }
    return out;
}

static inline uint64_t fmix64(uint64_t h) {
    h ^= (h >> 33);
    h *= 0xff51afd7ed558ccdULL;
    h ^= (h >> 33);
    h *= 0xc4ceb9fe1a85ec53ULL;
    h ^= (h >> 33);
    return h;
}

uint64_t hash64(const std::string &s, uint64_t seed) {
    uint64_t h = 14695981039346656037ULL ^ seed;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return fmix64(h);
}

uint64_t hash64(int64_t v, uint64_t seed) {
    // hash the 8 little-endian bytes so values and seeds mix like strings do
    uint64_t h = 14695981039346656037ULL ^ seed;
    uint64_t u = static_cast<uint64_t>(v);
    for (int i = 0; i < 8; i++) {
        h ^= (u >> (8 * i)) & 0xffULL;
        h *= 1099511628211ULL;
    }
    return fmix64(h);
}
