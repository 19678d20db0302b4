#pragma once

#include "core/retrieval/exploration_strategy.h"
#include "core/retrieval/knowledge_base.h"
#include "core/retrieval/retrieval_cache.h"
#include "core/retrieval/retriever.h"
#include "core/ranking/scorer.h"
#include "core/shared/exploration_config.h"

#include <QSet>
#include <QString>

#include <cstdint>
#include <mutex>
#include <vector>

namespace fr {

// Outcome of one retrieval, including the signals that shaped it.
struct RetrievalReport {
    std::vector<ScoredStatement> selection;   // aggregated pipeline scores
    double confidence = 0.0;                  // 0 on cache hits
    int requestedK = 0;
    int effectiveK = 0;                       // k handed to the exploration strategy
    int rankedCount = 0;                      // candidates in the final ranking
    bool cacheHit = false;
    std::vector<QString> iterationQueries;    // query used by each iteration

    std::vector<Statement> statements() const;
};

// KnowledgeRetriever -- multi-iteration lexical retrieval over a knowledge base.
//
// Per call: fingerprint/cache check, snapshot + dedup, one-time scorer warmup,
// then `iterations` rounds of gate -> score -> aggregate -> refine, a final
// ranking, a confidence estimate and selection by the exploration strategy.
//
// Thread-safe: one instance may serve concurrent callers. The collaborators
// must outlive the retriever.
class KnowledgeRetriever : public Retriever {
public:
    static constexpr int kDefaultCacheCapacity = 10000;
    static constexpr int kMinBandSize = 16;
    static constexpr int kRefineBandLimit = 12;
    static constexpr int kConfidenceWindow = 16;

    KnowledgeRetriever(const KnowledgeBase& knowledgeBase,
                       Scorer& scorer,
                       const ExplorationStrategy& exploration,
                       const ExplorationConfig& config,
                       int cacheCapacity = kDefaultCacheCapacity);

    KnowledgeRetriever(const KnowledgeRetriever&) = delete;
    KnowledgeRetriever& operator=(const KnowledgeRetriever&) = delete;

    using Retriever::retrieve;

    std::vector<Statement> retrieve(const QString& query, int k, uint64_t seed) override;
    std::vector<ScoredStatement> retrieveScored(const QString& query, int k,
                                                uint64_t seed) override;

    RetrievalReport retrieveWithReport(const QString& query, int k, uint64_t seed);

    const ExplorationConfig& config() const { return m_config; }
    RetrievalCache::Stats cacheStats() const { return m_cache.stats(); }

    // top1 / (sum of the first 16 positive scores + 1e-12); 0 when ranked is
    // empty or its top score is not positive. A concentration ratio, not a
    // probability.
    static double estimateConfidence(const std::vector<ScoredStatement>& ranked);

    // "<original>\ncontext: t1 t2 ..." built from the top refineTerms terms of
    // the first 12 band members, weighted by the sum of member scores.
    static QString refineQuery(const QString& originalQuery,
                               const std::vector<ScoredStatement>& band,
                               int refineTerms);

private:
    std::vector<Statement> dedupedSnapshot() const;
    void ensurePrepared(const std::vector<Statement>& corpus);
    bool gateMatches(const QSet<QString>& queryTerms, const Statement& statement) const;
    double safeScore(const QString& query, const Statement& statement) const;
    std::vector<Statement> safeSelect(const std::vector<ScoredStatement>& ranked, int k,
                                      uint64_t seed) const;

    static bool substringMatches(const QSet<QString>& queryTerms, const QString& text);

    const KnowledgeBase& m_knowledgeBase;
    Scorer& m_scorer;
    const ExplorationStrategy& m_exploration;
    const ExplorationConfig m_config;

    RetrievalCache m_cache;
    std::once_flag m_prepareOnce;
};

} // namespace fr
