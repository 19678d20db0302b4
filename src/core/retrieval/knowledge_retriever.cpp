#include "core/retrieval/knowledge_retriever.h"
#include "core/retrieval/fingerprint.h"
#include "core/shared/logging.h"
#include "core/text/query_normalizer.h"

#include <QHash>

#include <algorithm>
#include <cmath>
#include <exception>
#include <unordered_map>
#include <utility>

namespace fr {

namespace {

constexpr double kConfidenceEpsilon = 1e-12;

ExplorationConfig checkedConfig(const ExplorationConfig& config)
{
    if (config.isValid()) {
        return config;
    }
    LOG_WARN(frRetrieval, "ExplorationConfig out of range, falling back to defaults "
                          "for invalid fields");
    return config.sanitized();
}

struct IterationCandidate {
    size_t index = 0;   // position in the deduplicated snapshot
    double score = 0.0;
};

} // namespace

std::vector<Statement> RetrievalReport::statements() const
{
    std::vector<Statement> out;
    out.reserve(selection.size());
    for (const ScoredStatement& s : selection) {
        out.push_back(s.item);
    }
    return out;
}

KnowledgeRetriever::KnowledgeRetriever(const KnowledgeBase& knowledgeBase,
                                       Scorer& scorer,
                                       const ExplorationStrategy& exploration,
                                       const ExplorationConfig& config,
                                       int cacheCapacity)
    : m_knowledgeBase(knowledgeBase)
    , m_scorer(scorer)
    , m_exploration(exploration)
    , m_config(checkedConfig(config))
    , m_cache(cacheCapacity)
{
}

std::vector<Statement> KnowledgeRetriever::retrieve(const QString& query, int k, uint64_t seed)
{
    return retrieveWithReport(query, k, seed).statements();
}

std::vector<ScoredStatement> KnowledgeRetriever::retrieveScored(const QString& query, int k,
                                                                uint64_t seed)
{
    return retrieveWithReport(query, k, seed).selection;
}

std::vector<Statement> KnowledgeRetriever::dedupedSnapshot() const
{
    const std::vector<Statement> raw = m_knowledgeBase.snapshotSorted();

    std::vector<Statement> corpus;
    corpus.reserve(raw.size());
    QSet<QString> seen;
    seen.reserve(static_cast<int>(std::min<size_t>(4096, raw.size())));

    // Prefix scan: the first occurrence in snapshot order wins.
    for (const Statement& statement : raw) {
        const QString key = statement.dedupKey();
        if (key.isEmpty() || seen.contains(key)) {
            continue;
        }
        seen.insert(key);
        corpus.push_back(statement);
    }
    return corpus;
}

void KnowledgeRetriever::ensurePrepared(const std::vector<Statement>& corpus)
{
    std::call_once(m_prepareOnce, [this, &corpus]() {
        try {
            m_scorer.prepare(corpus);
            LOG_INFO(frRetrieval, "scorer warmed up over %zu statements", corpus.size());
        } catch (const std::exception& e) {
            LOG_WARN(frRetrieval, "scorer prepare failed, continuing unweighted: %s", e.what());
        } catch (...) {
            LOG_WARN(frRetrieval, "scorer prepare failed (unknown exception), continuing unweighted");
        }
    });
}

bool KnowledgeRetriever::substringMatches(const QSet<QString>& queryTerms, const QString& text)
{
    if (text.trimmed().isEmpty()) {
        return false;
    }
    const QString lower = text.toLower();
    for (const QString& term : queryTerms) {
        if (term.size() >= 3 && lower.contains(term)) {
            return true;
        }
    }
    return false;
}

bool KnowledgeRetriever::gateMatches(const QSet<QString>& queryTerms,
                                     const Statement& statement) const
{
    // Tier 1: the scorer's cached tokens.
    std::optional<std::vector<QString>> tokens;
    try {
        tokens = m_scorer.tokens(statement);
    } catch (const std::exception& e) {
        LOG_DEBUG(frRetrieval, "scorer tokens unavailable (%s), using substring gate", e.what());
        tokens.reset();
    } catch (...) {
        LOG_DEBUG(frRetrieval, "scorer tokens unavailable (unknown exception), using substring gate");
        tokens.reset();
    }

    if (tokens && !tokens->empty()) {
        for (const QString& token : *tokens) {
            if (queryTerms.contains(token)) {
                return true;
            }
        }
        return false;
    }

    // Tier 2: case-insensitive containment of the longer query terms.
    return substringMatches(queryTerms, statement.text);
}

double KnowledgeRetriever::safeScore(const QString& query, const Statement& statement) const
{
    try {
        return m_scorer.score(query, statement);
    } catch (const std::exception& e) {
        LOG_WARN(frRetrieval, "score failed for '%s': %s",
                 qUtf8Printable(statement.id), e.what());
        return 0.0;
    } catch (...) {
        LOG_WARN(frRetrieval, "score failed for '%s': unknown exception",
                 qUtf8Printable(statement.id));
        return 0.0;
    }
}

std::vector<Statement> KnowledgeRetriever::safeSelect(const std::vector<ScoredStatement>& ranked,
                                                      int k, uint64_t seed) const
{
    try {
        return m_exploration.select(ranked, k, m_config, seed);
    } catch (const std::exception& e) {
        LOG_WARN(frRetrieval, "exploration select failed, using ranked prefix: %s", e.what());
    } catch (...) {
        LOG_WARN(frRetrieval, "exploration select failed (unknown exception), using ranked prefix");
    }

    std::vector<Statement> prefix;
    const size_t limit = std::min(ranked.size(), static_cast<size_t>(std::max(0, k)));
    prefix.reserve(limit);
    for (size_t i = 0; i < limit; ++i) {
        prefix.push_back(ranked[i].item);
    }
    return prefix;
}

double KnowledgeRetriever::estimateConfidence(const std::vector<ScoredStatement>& ranked)
{
    if (ranked.empty()) {
        return 0.0;
    }
    const double top = ranked.front().score;
    if (!std::isfinite(top) || top <= 0.0) {
        return 0.0;
    }

    double mass = 0.0;
    const size_t window = std::min(ranked.size(), static_cast<size_t>(kConfidenceWindow));
    for (size_t i = 0; i < window; ++i) {
        const double s = ranked[i].score;
        if (std::isfinite(s) && s > 0.0) {
            mass += s;
        }
    }
    return mass <= 0.0 ? 0.0 : top / (mass + kConfidenceEpsilon);
}

QString KnowledgeRetriever::refineQuery(const QString& originalQuery,
                                        const std::vector<ScoredStatement>& band,
                                        int refineTerms)
{
    if (refineTerms <= 0 || band.empty()) {
        return originalQuery;
    }

    QHash<QString, double> weights;
    QHash<QString, int> firstSeen;
    std::vector<QString> order;

    int members = 0;
    for (const ScoredStatement& member : band) {
        if (member.item.isBlank()) {
            continue;
        }
        ++members;

        const std::vector<QString> terms = QueryNormalizer::queryTerms(member.item.text, 3);
        for (const QString& term : terms) {
            weights[term] += std::max(0.0, member.score);
            if (!firstSeen.contains(term)) {
                firstSeen.insert(term, static_cast<int>(order.size()));
                order.push_back(term);
            }
        }

        if (members >= kRefineBandLimit) {
            break;
        }
    }

    if (order.empty()) {
        return originalQuery;
    }

    std::stable_sort(order.begin(), order.end(), [&](const QString& a, const QString& b) {
        const double wa = weights.value(a);
        const double wb = weights.value(b);
        if (wa != wb) {
            return wa > wb;
        }
        return firstSeen.value(a) < firstSeen.value(b);
    });

    QString refined;
    const QString trimmed = originalQuery.trimmed();
    if (!trimmed.isEmpty()) {
        refined += trimmed;
        refined += QLatin1Char('\n');
    }
    refined += QStringLiteral("context: ");

    const int count = std::min(refineTerms, static_cast<int>(order.size()));
    for (int i = 0; i < count; ++i) {
        if (i > 0) {
            refined += QLatin1Char(' ');
        }
        refined += order[static_cast<size_t>(i)];
    }
    return refined;
}

RetrievalReport KnowledgeRetriever::retrieveWithReport(const QString& query, int k, uint64_t seed)
{
    const QString& q = query;
    const int requestedK = std::max(0, k);

    RetrievalReport report;
    report.requestedK = requestedK;

    const uint64_t fingerprint = queryFingerprint(seed, q);
    if (std::optional<std::vector<ScoredStatement>> cached = m_cache.get(fingerprint)) {
        if (static_cast<int>(cached->size()) > requestedK) {
            cached->resize(static_cast<size_t>(requestedK));
        }
        report.selection = std::move(*cached);
        report.effectiveK = static_cast<int>(report.selection.size());
        report.cacheHit = true;
        LOG_DEBUG(frRetrieval, "cache hit key=%llu q='%s'",
                  static_cast<unsigned long long>(fingerprint),
                  qUtf8Printable(QueryNormalizer::logPreview(q)));
        return report;
    }

    const std::vector<Statement> corpus = dedupedSnapshot();
    ensurePrepared(corpus);

    // Aggregated score per snapshot position; contributions from every
    // iteration are summed.
    std::vector<double> aggregate(corpus.size(), 0.0);
    std::vector<bool> touched(corpus.size(), false);

    const size_t bandSize = static_cast<size_t>(
        std::max<int64_t>(kMinBandSize, static_cast<int64_t>(requestedK) * 4));
    std::vector<ScoredStatement> band;

    QString iterQuery = q;
    double iterWeight = 1.0;

    for (int iter = 0; iter < m_config.iterations; ++iter) {
        report.iterationQueries.push_back(iterQuery);

        const std::vector<QString> terms =
            QueryNormalizer::queryTerms(iterQuery, m_config.candidateGateMinTokenLen);
        QSet<QString> termSet;
        for (const QString& t : terms) {
            termSet.insert(t);
        }

        std::vector<IterationCandidate> scored;
        scored.reserve(std::min(corpus.size(),
                                static_cast<size_t>(m_config.maxCandidatesPerIter)));

        // The candidate cap counts scored statements in snapshot order, not in
        // score order: once it is reached the rest of the snapshot is not
        // looked at in this iteration, however relevant it might be.
        int processed = 0;
        for (size_t i = 0; i < corpus.size(); ++i) {
            const Statement& statement = corpus[i];
            if (statement.isBlank()) {
                continue;
            }
            if (!termSet.isEmpty() && !gateMatches(termSet, statement)) {
                continue;
            }

            const double s = safeScore(iterQuery, statement);
            if (!std::isfinite(s) || s < m_config.minScore) {
                continue;
            }

            const double weighted = s * iterWeight;
            scored.push_back({i, weighted});
            aggregate[i] += weighted;
            touched[i] = true;

            if (++processed >= m_config.maxCandidatesPerIter) {
                break;
            }
        }

        std::stable_sort(scored.begin(), scored.end(),
                         [&corpus](const IterationCandidate& a, const IterationCandidate& b) {
                             if (a.score != b.score) {
                                 return a.score > b.score;
                             }
                             return idLess(corpus[a.index], corpus[b.index]);
                         });

        band.clear();
        const size_t keep = std::min(bandSize, scored.size());
        band.reserve(keep);
        for (size_t i = 0; i < keep; ++i) {
            band.emplace_back(corpus[scored[i].index], scored[i].score);
        }

        if (iter + 1 < m_config.iterations) {
            iterQuery = refineQuery(q, band, m_config.refineTerms);
            iterWeight *= m_config.iterationDecay;
        }
    }

    std::vector<ScoredStatement> ranked;
    for (size_t i = 0; i < corpus.size(); ++i) {
        if (!touched[i]) {
            continue;
        }
        const double s = aggregate[i];
        if (std::isfinite(s) && s >= m_config.minScore) {
            ranked.emplace_back(corpus[i], s);
        }
    }
    rankScored(ranked);
    report.rankedCount = static_cast<int>(ranked.size());

    report.confidence = estimateConfidence(ranked);

    int outK = requestedK;
    if (m_config.qualityFloor > 0.0 && report.confidence < m_config.qualityFloor) {
        // Low confidence: trade recall for precision.
        outK = std::min(outK, std::max(1, requestedK / 2));
    }
    report.effectiveK = outK;

    LOG_DEBUG(frRetrieval, "retrieve q='%s' ranked=%d confidence=%.4f k=%d->%d",
              qUtf8Printable(QueryNormalizer::logPreview(q)), report.rankedCount,
              report.confidence, requestedK, outK);

    std::vector<Statement> selected = safeSelect(ranked, outK, seed);
    if (static_cast<int>(selected.size()) > outK) {
        selected.resize(static_cast<size_t>(outK));
    }

    QHash<QString, double> scoreByKey;
    for (const ScoredStatement& r : ranked) {
        scoreByKey.insert(r.item.dedupKey(), r.score);
    }
    report.selection.reserve(selected.size());
    for (Statement& statement : selected) {
        const double s = scoreByKey.value(statement.dedupKey(), 0.0);
        report.selection.emplace_back(std::move(statement), s);
    }

    if (m_cache.enabled()) {
        m_cache.put(fingerprint, report.selection);
        LOG_DEBUG(frRetrieval, "cache store key=%llu -> %zu",
                  static_cast<unsigned long long>(fingerprint), report.selection.size());
    }

    return report;
}

} // namespace fr
