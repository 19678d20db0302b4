#include "core/ranking/token_overlap_scorer.h"
#include "core/shared/logging.h"

#include <QSet>

#include <algorithm>
#include <cmath>
#include <utility>

namespace fr {

TokenOverlapScorer::TokenOverlapScorer(const Tokenizer& tokenizer)
    : m_tokenizer(tokenizer)
{
}

std::vector<QString> TokenOverlapScorer::scoredTokens(const QString& text) const
{
    std::vector<QString> out;
    if (text.trimmed().isEmpty()) {
        return out;
    }

    const std::vector<QString> raw = m_tokenizer.tokenize(text);
    out.reserve(raw.size());
    for (const QString& token : raw) {
        QString t = token.trimmed().toLower();
        if (t.size() < kMinScoredTokenLength) {
            continue;
        }
        out.push_back(std::move(t));
    }
    return out;
}

std::shared_ptr<const TokenOverlapScorer::IdfTable> TokenOverlapScorer::idfSnapshot() const
{
    std::lock_guard<std::mutex> lock(m_idfMutex);
    return m_idf;
}

void TokenOverlapScorer::prepare(const std::vector<Statement>& corpus)
{
    State expected = State::Unprepared;
    if (!m_state.compare_exchange_strong(expected, State::Preparing)) {
        return;
    }

    try {
        std::unordered_map<QString, int, QStringHash> documentFrequency;
        std::unordered_map<QString, std::vector<QString>, QStringHash> corpusTokens;
        int documents = 0;

        for (const Statement& statement : corpus) {
            if (statement.isBlank()) {
                continue;
            }
            ++documents;

            std::vector<QString> tokens = scoredTokens(statement.text);
            QSet<QString> unique;
            for (const QString& t : tokens) {
                unique.insert(t);
            }
            for (const QString& t : unique) {
                ++documentFrequency[t];
            }

            const QString key = statement.dedupKey();
            if (!key.isEmpty()) {
                corpusTokens.emplace(key, std::move(tokens));
            }
        }

        const double n = std::max(1.0, static_cast<double>(documents));
        auto table = std::make_shared<IdfTable>();
        table->reserve(documentFrequency.size());
        for (const auto& [token, df] : documentFrequency) {
            (*table)[token] = std::log((n + 1.0) / (static_cast<double>(df) + 1.0)) + 1.0;
        }

        {
            std::lock_guard<std::mutex> lock(m_tokenCacheMutex);
            for (auto& [key, tokens] : corpusTokens) {
                m_tokenCache.try_emplace(key, std::move(tokens));
            }
        }
        {
            std::lock_guard<std::mutex> lock(m_idfMutex);
            m_idf = std::move(table);
        }

        LOG_INFO(frRanking, "prepare: %d documents, %zu distinct tokens",
                 documents, documentFrequency.size());
    } catch (...) {
        // Statistics stay empty (unweighted scoring) and the scorer never
        // attempts another build.
        m_state.store(State::Ready);
        throw;
    }

    m_state.store(State::Ready);
}

bool TokenOverlapScorer::isPrepared() const
{
    return m_state.load() == State::Ready;
}

double TokenOverlapScorer::idf(const QString& token) const
{
    const auto table = idfSnapshot();
    if (!table) {
        return 1.0;
    }
    const auto it = table->find(token);
    return it != table->end() ? it->second : 1.0;
}

int TokenOverlapScorer::vocabularySize() const
{
    const auto table = idfSnapshot();
    return table ? static_cast<int>(table->size()) : 0;
}

std::optional<std::vector<QString>> TokenOverlapScorer::tokens(const Statement& statement) const
{
    const QString key = statement.dedupKey();
    if (key.isEmpty()) {
        return std::vector<QString>{};
    }

    {
        std::lock_guard<std::mutex> lock(m_tokenCacheMutex);
        const auto it = m_tokenCache.find(key);
        if (it != m_tokenCache.end()) {
            return it->second;
        }
    }

    // Tokenize outside the lock; a racing thread computes the same value and
    // the first insert wins.
    std::vector<QString> computed = scoredTokens(statement.text);
    std::lock_guard<std::mutex> lock(m_tokenCacheMutex);
    const auto [it, inserted] = m_tokenCache.try_emplace(key, std::move(computed));
    Q_UNUSED(inserted);
    return it->second;
}

double TokenOverlapScorer::score(const QString& query, const Statement& statement) const
{
    if (statement.isBlank() || query.trimmed().isEmpty()) {
        return 0.0;
    }

    const std::vector<QString> queryTokens = scoredTokens(query);
    const std::optional<std::vector<QString>> docTokens = tokens(statement);
    if (queryTokens.empty() || !docTokens || docTokens->empty()) {
        return 0.0;
    }

    const auto table = idfSnapshot();
    const auto weightOf = [&table](const QString& token) {
        if (!table) {
            return 1.0;
        }
        const auto it = table->find(token);
        return it != table->end() ? it->second : 1.0;
    };

    std::unordered_map<QString, double, QStringHash> queryWeights;
    for (const QString& t : queryTokens) {
        queryWeights[t] += weightOf(t);
    }
    std::unordered_map<QString, double, QStringHash> docWeights;
    for (const QString& t : *docTokens) {
        docWeights[t] += weightOf(t);
    }

    double queryNorm2 = 0.0;
    for (const auto& [token, w] : queryWeights) {
        queryNorm2 += w * w;
    }

    double dot = 0.0;
    double docNorm2 = 0.0;
    for (const auto& [token, w] : docWeights) {
        docNorm2 += w * w;
        const auto it = queryWeights.find(token);
        if (it != queryWeights.end()) {
            dot += it->second * w;
        }
    }

    if (!(dot > 0.0)) {
        return 0.0;
    }
    const double denom = std::sqrt(queryNorm2) * std::sqrt(docNorm2);
    if (!(denom > 0.0) || !std::isfinite(denom)) {
        return 0.0;
    }

    const double result = (dot / denom) * statement.effectiveWeight();
    return std::isfinite(result) && result > 0.0 ? result : 0.0;
}

} // namespace fr
