#pragma once

#include "core/ranking/scorer.h"
#include "core/retrieval/exploration_strategy.h"
#include "core/retrieval/knowledge_base.h"

#include <QString>

#include <atomic>
#include <vector>

namespace fr::test {

Statement makeStatement(const QString& id, const QString& text, double weight = 1.0);

// The three-statement corpus used by the end-to-end scenarios.
std::vector<Statement> rustCorpus();

// Returns its statements verbatim, duplicates and blanks included.
class VectorKnowledgeBase : public KnowledgeBase {
public:
    explicit VectorKnowledgeBase(std::vector<Statement> statements);
    std::vector<Statement> snapshotSorted() const override;

private:
    std::vector<Statement> m_statements;
};

// Scores every (query, statement) pair with the same value and exposes no
// tokens, so gating falls back to substring matching.
class ConstantScorer : public Scorer {
public:
    explicit ConstantScorer(double value = 1.0);

    double score(const QString& query, const Statement& statement) const override;
    void prepare(const std::vector<Statement>& corpus) override;

    int prepareCalls() const { return m_prepareCalls.load(); }
    int scoreCalls() const { return m_scoreCalls.load(); }

private:
    double m_value;
    std::atomic<int> m_prepareCalls{0};
    mutable std::atomic<int> m_scoreCalls{0};
};

// Wraps another scorer and counts calls; selected operations can be made to throw.
class ProbeScorer : public Scorer {
public:
    explicit ProbeScorer(Scorer& inner);

    double score(const QString& query, const Statement& statement) const override;
    void prepare(const std::vector<Statement>& corpus) override;
    std::optional<std::vector<QString>> tokens(const Statement& statement) const override;

    bool throwOnPrepare = false;
    bool throwOnTokens = false;
    QString throwOnScoreForId;

    // Throw an int instead of a std::exception from the failing operations.
    bool throwNonStandard = false;

    int prepareCalls() const { return m_prepareCalls.load(); }
    int scoreCalls() const { return m_scoreCalls.load(); }

private:
    Scorer& m_inner;
    std::atomic<int> m_prepareCalls{0};
    mutable std::atomic<int> m_scoreCalls{0};
};

class ThrowingStrategy : public ExplorationStrategy {
public:
    explicit ThrowingStrategy(bool nonStandard = false);

    std::vector<Statement> select(const std::vector<ScoredStatement>& ranked,
                                  int k,
                                  const ExplorationConfig& config,
                                  uint64_t seed) const override;

private:
    bool m_nonStandard;
};

} // namespace fr::test
