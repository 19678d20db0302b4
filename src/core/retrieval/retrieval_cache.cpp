#include "core/retrieval/retrieval_cache.h"

#include <algorithm>
#include <utility>

namespace fr {

RetrievalCache::RetrievalCache(int capacity)
    : m_capacity(std::max(0, capacity))
{
}

std::optional<std::vector<ScoredStatement>> RetrievalCache::get(uint64_t fingerprint)
{
    if (!enabled()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(fingerprint);
    if (it == m_index.end()) {
        ++m_misses;
        return std::nullopt;
    }

    // Move to front (most recently used)
    if (it->second != m_list.begin()) {
        m_list.splice(m_list.begin(), m_list, it->second);
    }

    ++m_hits;
    return it->second->selection;
}

void RetrievalCache::put(uint64_t fingerprint, std::vector<ScoredStatement> selection)
{
    if (!enabled()) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    auto existing = m_index.find(fingerprint);
    if (existing != m_index.end()) {
        existing->second->selection = std::move(selection);
        m_list.splice(m_list.begin(), m_list, existing->second);
        return;
    }

    while (static_cast<int>(m_list.size()) >= m_capacity && !m_list.empty()) {
        m_index.erase(m_list.back().fingerprint);
        m_list.pop_back();
        ++m_evictions;
    }

    m_list.push_front({fingerprint, std::move(selection)});
    m_index[fingerprint] = m_list.begin();
}

void RetrievalCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_list.clear();
    m_index.clear();
}

RetrievalCache::Stats RetrievalCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_hits, m_misses, m_evictions, static_cast<int>(m_list.size())};
}

} // namespace fr
