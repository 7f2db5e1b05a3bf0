#include "minhash_sampler.hpp"
#include "hash.hpp"
#include <limits>
#include <stdexcept>

MinHashSampler::MinHashSampler(size_t k, uint64_t seed)
    : k_(k), seed_(splitmix64(seed))
{
    if (k_ == 0) throw std::invalid_argument("MinHashSampler: k must be >= 1");
}

uint64_t MinHashSampler::hash_item(const std::string &item) const {
    return hash64(item, seed_);
}

void MinHashSampler::consider(const std::string &item) {
    uint64_t h = hash_item(item);
    if (held_.count(h)) return; // same item (or a 64-bit collision) already sampled

    if (heap_.size() < k_) {
        heap_.emplace(h, item);
        held_.insert(h);
        return;
    }
    if (h < heap_.top().first) {
        held_.erase(heap_.top().first);
        heap_.pop();
        heap_.emplace(h, item);
        held_.insert(h);
    }
}

std::vector<std::string> MinHashSampler::sample() const {
    // priority_queue hides its container; copy and drain
    auto copy = heap_;
    std::vector<std::string> out;
    out.reserve(copy.size());
    while (!copy.empty()) {
        out.push_back(copy.top().second);
        copy.pop();
    }
    return out;
}

uint64_t MinHashSampler::max_held_hash() const {
    return heap_.empty() ? std::numeric_limits<uint64_t>::max() : heap_.top().first;
}
