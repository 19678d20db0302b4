#pragma once

#include "core/ranking/scorer.h"
#include "core/text/tokenizer.h"

#include <QString>

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace fr {

// IDF-weighted cosine over token sums.
//
//   idf(t)  = ln((N + 1) / (df(t) + 1)) + 1     (1.0 for unseen tokens)
//   score   = dot(qw, dw) / (|qw| * |dw|) * statement.effectiveWeight()
//
// Only tokens of length >= 3 take part in statistics and scoring.
class TokenOverlapScorer : public Scorer {
public:
    static constexpr int kMinScoredTokenLength = 3;

    explicit TokenOverlapScorer(const Tokenizer& tokenizer);

    TokenOverlapScorer(const TokenOverlapScorer&) = delete;
    TokenOverlapScorer& operator=(const TokenOverlapScorer&) = delete;

    double score(const QString& query, const Statement& statement) const override;

    // Builds document frequencies once. Later calls, and calls racing with an
    // in-flight build, return immediately.
    void prepare(const std::vector<Statement>& corpus) override;

    std::optional<std::vector<QString>> tokens(const Statement& statement) const override;

    bool isPrepared() const;
    double idf(const QString& token) const;
    int vocabularySize() const;

private:
    struct QStringHash {
        size_t operator()(const QString& s) const { return qHash(s); }
    };
    using IdfTable = std::unordered_map<QString, double, QStringHash>;

    enum class State { Unprepared, Preparing, Ready };

    std::vector<QString> scoredTokens(const QString& text) const;
    std::shared_ptr<const IdfTable> idfSnapshot() const;

    const Tokenizer& m_tokenizer;

    std::atomic<State> m_state{State::Unprepared};

    mutable std::mutex m_idfMutex;
    std::shared_ptr<const IdfTable> m_idf;

    // Append-only; entries are never invalidated.
    mutable std::mutex m_tokenCacheMutex;
    mutable std::unordered_map<QString, std::vector<QString>, QStringHash> m_tokenCache;
};

} // namespace fr
