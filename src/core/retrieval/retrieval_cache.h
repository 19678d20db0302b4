#pragma once

#include "core/shared/scored.h"

#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace fr {

// Bounded LRU map from a (seed, query) fingerprint to a selected result list.
// No TTL: entries leave only through capacity eviction or clear().
// A capacity <= 0 disables the cache; nothing is ever stored or read.
class RetrievalCache {
public:
    explicit RetrievalCache(int capacity);

    bool enabled() const { return m_capacity > 0; }
    int capacity() const { return m_capacity; }

    std::optional<std::vector<ScoredStatement>> get(uint64_t fingerprint);
    void put(uint64_t fingerprint, std::vector<ScoredStatement> selection);
    void clear();

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        int currentSize = 0;
    };
    Stats stats() const;

private:
    struct Entry {
        uint64_t fingerprint = 0;
        std::vector<ScoredStatement> selection;
    };

    const int m_capacity;
    mutable std::mutex m_mutex;
    std::list<Entry> m_list;  // front = most recently used
    std::unordered_map<uint64_t, std::list<Entry>::iterator> m_index;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
};

} // namespace fr
