#include "core/retrieval/retriever.h"
#include "core/retrieval/fingerprint.h"
#include "core/text/query_normalizer.h"

#include <QSet>

#include <algorithm>

namespace fr {

namespace {

constexpr uint64_t kGoldenGamma = 0x9E3779B97F4A7C15ULL;

} // namespace

uint64_t Retriever::subSeed(uint64_t seed, int index)
{
    return mixSeed(seed, static_cast<uint64_t>(index + 1) * kGoldenGamma);
}

QString Retriever::mergeKey(const Statement& statement)
{
    if (statement.hasId()) {
        return QStringLiteral("id:") + statement.id;
    }
    const QString key = QueryNormalizer::mergeKey(statement.text);
    if (key.isEmpty()) {
        return {};
    }
    return QStringLiteral("tx:") + key;
}

std::vector<Statement> Retriever::retrieve(const std::vector<QString>& queries, int k,
                                           uint64_t seed)
{
    std::vector<Statement> merged;
    if (k <= 0 || queries.empty()) {
        return merged;
    }

    std::vector<QString> active;
    active.reserve(queries.size());
    for (const QString& q : queries) {
        if (!q.trimmed().isEmpty()) {
            active.push_back(q);
        }
    }
    if (active.empty()) {
        return merged;
    }

    const int n = static_cast<int>(active.size());
    const int perQuery = static_cast<int>(
        std::max<int64_t>(1, (static_cast<int64_t>(k) + n - 1) / n));

    QSet<QString> seen;
    for (int i = 0; i < n && static_cast<int>(merged.size()) < k; ++i) {
        const std::vector<Statement> results = retrieve(active[static_cast<size_t>(i)],
                                                        perQuery, subSeed(seed, i));
        for (const Statement& statement : results) {
            const QString key = mergeKey(statement);
            if (key.isEmpty() || seen.contains(key)) {
                continue;
            }
            seen.insert(key);
            merged.push_back(statement);
            if (static_cast<int>(merged.size()) >= k) {
                break;
            }
        }
    }

    return merged;
}

std::vector<ScoredStatement> Retriever::retrieveScored(const QString& query, int k,
                                                       uint64_t seed)
{
    const std::vector<Statement> results = retrieve(query, k, seed);
    std::vector<ScoredStatement> scored;
    scored.reserve(results.size());
    for (size_t rank = 0; rank < results.size(); ++rank) {
        scored.emplace_back(results[rank], 1.0 / static_cast<double>(rank + 1));
    }
    return scored;
}

} // namespace fr
