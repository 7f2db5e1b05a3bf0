#include "space_saving.hpp"
#include <unordered_map>
#include <queue>
#include <utility>
#include <algorithm>
#include <stdexcept>

struct SpaceSaving::Impl {
    explicit Impl(size_t cap) : capacity(cap) {}

    struct Entry {
        uint64_t count;
        uint64_t error; // count inherited from the evicted key
    };

    std::unordered_map<std::string, Entry> table;

    // Lazy min-heap of (count, key). Stale records (key evicted or count
    // since increased) are discarded when they reach the top.
    using HeapItem = std::pair<uint64_t, std::string>;
    std::priority_queue<HeapItem, std::vector<HeapItem>, std::greater<HeapItem>> minheap;

    size_t capacity;

    // Pop stale records until the top reflects a live minimum.
    void settle() {
        while (!minheap.empty()) {
            const auto &top = minheap.top();
            auto it = table.find(top.second);
            if (it != table.end() && it->second.count == top.first) return;
            minheap.pop();
        }
    }
};

SpaceSaving::SpaceSaving(size_t capacity) {
    if (capacity == 0) throw std::invalid_argument("SpaceSaving: capacity must be >= 1");
    impl_ = std::make_unique<Impl>(capacity);
}

SpaceSaving::~SpaceSaving() = default;

void SpaceSaving::update(const std::string &key, uint64_t cnt) {
    if (cnt == 0) return;
    Impl &I = *impl_;

    auto it = I.table.find(key);
    if (it != I.table.end()) {
        it->second.count += cnt;
        I.minheap.emplace(it->second.count, it->first);
        return;
    }

    if (I.table.size() < I.capacity) {
        I.table.emplace(key, Impl::Entry{cnt, 0});
        I.minheap.emplace(cnt, key);
        return;
    }

    // table full: replace the current minimum, inheriting its count as error
    I.settle();
    if (I.minheap.empty()) {
        // every table entry has a heap record, so this means corrupted state
        throw std::logic_error("SpaceSaving: heap lost track of table entries");
    }
    std::string victim = I.minheap.top().second;
    I.minheap.pop();
    uint64_t min_count = I.table[victim].count;
    I.table.erase(victim);

    uint64_t newcount = min_count + cnt;
    I.table.emplace(key, Impl::Entry{newcount, min_count});
    I.minheap.emplace(newcount, key);
}

std::vector<std::pair<std::string, uint64_t>> SpaceSaving::topk(size_t k) const {
    const Impl &I = *impl_;
    std::vector<std::pair<std::string, uint64_t>> vec;
    vec.reserve(I.table.size());
    for (const auto &p : I.table) vec.emplace_back(p.first, p.second.count);

    auto by_count = [](const auto &a, const auto &b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    };
    if (k == 0 || vec.size() <= k) {
        std::sort(vec.begin(), vec.end(), by_count);
        return vec;
    }
    std::partial_sort(vec.begin(), vec.begin() + k, vec.end(), by_count);
    vec.resize(k);
    return vec;
}

uint64_t SpaceSaving::estimate(const std::string &key) const {
    auto it = impl_->table.find(key);
    return it == impl_->table.end() ? 0 : it->second.count;
}

uint64_t SpaceSaving::error(const std::string &key) const {
    auto it = impl_->table.find(key);
    return it == impl_->table.end() ? 0 : it->second.error;
}

size_t SpaceSaving::get_capacity() const {
    return impl_->capacity;
}
