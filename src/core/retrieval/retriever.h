#pragma once

#include "core/shared/scored.h"

#include <QString>

#include <cstdint>
#include <vector>

namespace fr {

// Retriever -- top-k statement retrieval for free-text queries.
//
// Only the single-query retrieve() is required. Multi-query merge and the
// scored view have default implementations layered on top of it; concrete
// retrievers may override either (e.g. with a true batched search) as long as
// the observable behavior stays the same.
class Retriever {
public:
    virtual ~Retriever() = default;

    // Up to k statements, deterministic for fixed (query, k, seed, corpus).
    virtual std::vector<Statement> retrieve(const QString& query, int k, uint64_t seed) = 0;

    // Runs one retrieval per non-blank query with ceil(k / n) results each and
    // a per-query sub-seed, then merges in query order. Duplicates (same id,
    // or same normalized text for id-less statements) keep their first
    // occurrence. Stops as soon as k statements are collected.
    virtual std::vector<Statement> retrieve(const std::vector<QString>& queries, int k,
                                            uint64_t seed);

    // retrieve() paired with scores. The default assigns reciprocal-rank
    // scores 1 / (rank + 1).
    virtual std::vector<ScoredStatement> retrieveScored(const QString& query, int k,
                                                        uint64_t seed);

    // Seed of the index-th non-blank query in a multi-query retrieval.
    // Distinct indices always give distinct sub-seeds.
    static uint64_t subSeed(uint64_t seed, int index);

    // Identity used by the multi-query merge.
    static QString mergeKey(const Statement& statement);
};

} // namespace fr
