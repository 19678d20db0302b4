#pragma once

#include <QString>

#include <vector>

namespace fr {

class QueryNormalizer {
public:
    static constexpr int kMaxQueryTerms = 24;
    static constexpr int kMergeKeyLength = 160;
    static constexpr int kLogPreviewLength = 120;

    // Lowercased runs of letters, decimal digits and '_' that are at least
    // minLength long. The first maxTerms runs are kept, then de-duplicated in
    // first-occurrence order.
    static std::vector<QString> queryTerms(const QString& text, int minLength,
                                           int maxTerms = kMaxQueryTerms);

    // Key used to fold near-identical statement texts together: trimmed,
    // lowercased, inner whitespace collapsed to one space, first 160 chars.
    static QString mergeKey(const QString& text);

    // Single-line, length-capped form of a query for log lines.
    static QString logPreview(const QString& query);
};

} // namespace fr
