#include "core/text/query_normalizer.h"

#include <QSet>

namespace fr {

namespace {

bool isTermChar(QChar ch)
{
    return ch.isLetter() || ch.isDigit() || ch == QLatin1Char('_');
}

} // namespace

std::vector<QString> QueryNormalizer::queryTerms(const QString& text, int minLength,
                                                 int maxTerms)
{
    std::vector<QString> terms;
    if (text.trimmed().isEmpty() || maxTerms <= 0) {
        return terms;
    }

    const QString lower = text.toLower();
    QSet<QString> seen;
    int collected = 0;
    int start = -1;

    // One past the end acts as a final separator.
    for (int i = 0; i <= lower.size(); ++i) {
        const bool inTerm = i < lower.size() && isTermChar(lower.at(i));
        if (inTerm) {
            if (start < 0) {
                start = i;
            }
            continue;
        }
        if (start < 0) {
            continue;
        }

        const int length = i - start;
        if (length >= minLength) {
            const QString term = lower.mid(start, length);
            ++collected;
            if (!seen.contains(term)) {
                seen.insert(term);
                terms.push_back(term);
            }
            if (collected >= maxTerms) {
                break;
            }
        }
        start = -1;
    }

    return terms;
}

QString QueryNormalizer::mergeKey(const QString& text)
{
    QString key = text.trimmed().toLower().simplified();
    if (key.size() > kMergeKeyLength) {
        key.truncate(kMergeKeyLength);
    }
    return key;
}

QString QueryNormalizer::logPreview(const QString& query)
{
    QString preview = query;
    preview.replace(QLatin1Char('\n'), QLatin1Char(' '));
    preview.replace(QLatin1Char('\r'), QLatin1Char(' '));
    preview = preview.trimmed();
    if (preview.size() > kLogPreviewLength) {
        preview.truncate(kLogPreviewLength);
    }
    return preview;
}

} // namespace fr
