#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <cstddef>

// Seeded 64-bit hashing shared by the sketches.
// Output is 64 bits (FNV-1a + murmur3 finalizer), not cryptographic:
// two distinct keys collide with probability ~2^-64 per pair.

uint64_t splitmix64(uint64_t x);

// Derive `n` independent per-instance seeds from one construction seed.
std::vector<uint64_t> derive_seeds(uint64_t seed, size_t n);

uint64_t hash64(const std::string &s, uint64_t seed);
uint64_t hash64(int64_t v, uint64_t seed);
