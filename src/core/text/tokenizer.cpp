#include "core/text/tokenizer.h"
#include "core/shared/logging.h"

#include <QSet>

#include <algorithm>
#include <utility>

namespace fr {

Tokenizer::Tokenizer(TokenizerConfig config)
    : m_config(std::move(config))
{
    const int requestedMin = m_config.minTokenLength;
    const int requestedMax = m_config.maxTokenLength;
    m_config.minTokenLength = std::max(1, m_config.minTokenLength);
    m_config.maxTokenLength = std::max(m_config.minTokenLength, m_config.maxTokenLength);

    if (requestedMin != m_config.minTokenLength || requestedMax != m_config.maxTokenLength) {
        LOG_WARN(frText, "Tokenizer: length bounds [%d, %d] adjusted to [%d, %d]",
                 requestedMin, requestedMax, m_config.minTokenLength, m_config.maxTokenLength);
    }
}

bool Tokenizer::isBaseTokenChar(QChar ch)
{
    return ch.isLetter() || ch.isDigit();
}

// foo-bar, snake_case, o’neill, node.js, v2.1.0
bool Tokenizer::isInnerConnector(QChar ch)
{
    switch (ch.unicode()) {
    case '-':
    case '_':
    case '\'':
    case 0x2019: // ’
    case '.':
    case '+':
    case '#':
        return true;
    default:
        return false;
    }
}

bool Tokenizer::isTrailingPunctuation(QChar ch)
{
    switch (ch.unicode()) {
    case '.':
    case ',':
    case ';':
    case ':':
    case '!':
    case '?':
    case ')':
    case ']':
    case '}':
        return true;
    default:
        return false;
    }
}

bool Tokenizer::isBreak(QChar ch)
{
    return ch.isSpace() || ch.category() == QChar::Other_Control;
}

QString Tokenizer::normalize(const QString& text) const
{
    QString normalized = text.normalized(QString::NormalizationForm_KC).toLower();
    if (!m_config.stripDiacritics) {
        return normalized;
    }

    normalized = normalized.normalized(QString::NormalizationForm_D);
    QString stripped;
    stripped.reserve(normalized.size());
    for (const QChar ch : normalized) {
        const QChar::Category category = ch.category();
        const bool isCombiningMark = category == QChar::Mark_NonSpacing
                                   || category == QChar::Mark_SpacingCombining
                                   || category == QChar::Mark_Enclosing;
        if (!isCombiningMark) {
            stripped.append(ch);
        }
    }
    return stripped;
}

bool Tokenizer::passesQualityGate(const QString& token)
{
    const int n = token.size();
    if (n == 0) {
        return false;
    }

    int letters = 0;
    int digits = 0;
    int other = 0;
    for (const QChar ch : token) {
        if (ch.isLetter()) {
            ++letters;
        } else if (ch.isDigit()) {
            ++digits;
        } else {
            ++other;
        }
    }

    if (letters == 0 && digits == 0) {
        return false;
    }

    // Long all-digit runs are ids, not words.
    if (letters == 0) {
        return n <= kMaxNumericTokenLength;
    }

    return static_cast<double>(other) / static_cast<double>(n) <= kMaxSymbolRatio;
}

void Tokenizer::addToken(std::vector<QString>& out, QString token) const
{
    if (token.size() < m_config.minTokenLength) {
        return;
    }
    if (token.size() > m_config.maxTokenLength) {
        token.truncate(m_config.maxTokenLength);
    }
    if (!passesQualityGate(token)) {
        return;
    }
    out.push_back(std::move(token));
}

int Tokenizer::consumeUntilBreak(const QString& s, int i)
{
    const int n = s.size();
    int j = i;
    while (j < n && !isBreak(s.at(j))) {
        ++j;
    }
    return j;
}

int Tokenizer::trimTrailingPunctuation(const QString& s, int begin, int end)
{
    while (end > begin && isTrailingPunctuation(s.at(end - 1))) {
        --end;
    }
    return end;
}

bool Tokenizer::looksLikeUrlStart(const QString& s, int i)
{
    // Each scheme needs at least one character after it.
    const int remaining = s.size() - i;
    if (remaining > 7 && s.mid(i, 7) == QLatin1String("http://")) {
        return true;
    }
    if (remaining > 8 && s.mid(i, 8) == QLatin1String("https://")) {
        return true;
    }
    return remaining > 4 && s.mid(i, 4) == QLatin1String("www.");
}

int Tokenizer::consumeUrl(const QString& s, int i)
{
    return trimTrailingPunctuation(s, i, consumeUntilBreak(s, i));
}

bool Tokenizer::looksLikeEmailStart(const QString& s, int i)
{
    const int n = s.size();
    if (i >= n || !isBaseTokenChar(s.at(i))) {
        return false;
    }

    for (int j = i; j < n; ++j) {
        const QChar ch = s.at(j);
        if (isBreak(ch)) {
            return false;
        }
        if (ch == QLatin1Char('@')) {
            return j > i && j + 1 < n;
        }
    }
    return false;
}

// Returns the end of a validated email starting at i, or -1.
int Tokenizer::consumeEmail(const QString& s, int i)
{
    const int n = s.size();
    int j = i;

    while (j < n) {
        const QChar ch = s.at(j);
        if (ch == QLatin1Char('@')) {
            break;
        }
        const bool localChar = isBaseTokenChar(ch)
                               || ch == QLatin1Char('.') || ch == QLatin1Char('_')
                               || ch == QLatin1Char('+') || ch == QLatin1Char('-');
        if (!localChar) {
            return -1;
        }
        ++j;
    }
    if (j <= i || j >= n) {
        return -1;
    }
    ++j; // '@'

    const int domainStart = j;
    bool hasDot = false;
    while (j < n) {
        const QChar ch = s.at(j);
        if (ch == QLatin1Char('.')) {
            hasDot = true;
        } else if (!isBaseTokenChar(ch) && ch != QLatin1Char('-')) {
            break;
        }
        ++j;
    }
    if (j <= domainStart || !hasDot) {
        return -1;
    }

    return trimTrailingPunctuation(s, i, j);
}

// Body of a #hashtag or @mention starting at i (the character after the sigil).
int Tokenizer::consumeTag(const QString& s, int i)
{
    const int n = s.size();
    int j = i;
    while (j < n) {
        const QChar ch = s.at(j);
        if (!isBaseTokenChar(ch) && ch != QLatin1Char('_') && ch != QLatin1Char('.')) {
            break;
        }
        ++j;
    }
    while (j > i && s.at(j - 1) == QLatin1Char('.')) {
        --j;
    }
    return j;
}

std::vector<QString> Tokenizer::tokenize(const QString& text) const
{
    const QString raw = text.trimmed();
    if (raw.isEmpty()) {
        return {};
    }

    const QString s = normalize(raw);
    const int n = s.size();

    std::vector<QString> out;
    out.reserve(static_cast<size_t>(std::min(64, n / 4 + 1)));

    QString token;
    int i = 0;
    while (i < n) {
        const QChar ch = s.at(i);

        if (m_config.keepUrls && looksLikeUrlStart(s, i)) {
            const int j = consumeUrl(s, i);
            addToken(out, s.mid(i, j - i));
            i = std::max(j, i + 1);
            continue;
        }

        if (m_config.keepEmails && looksLikeEmailStart(s, i)) {
            const int j = consumeEmail(s, i);
            if (j > i) {
                addToken(out, s.mid(i, j - i));
                i = j;
                continue;
            }
        }

        const bool isTagSigil = (ch == QLatin1Char('#') && m_config.keepHashtags)
                                || (ch == QLatin1Char('@') && m_config.keepMentions);
        if (isTagSigil && i + 1 < n && isBaseTokenChar(s.at(i + 1))) {
            const int j = consumeTag(s, i + 1);
            addToken(out, s.mid(i, j - i));
            i = j;
            continue;
        }

        if (isBaseTokenChar(ch)) {
            token.clear();
            token.append(ch);
            ++i;

            while (i < n) {
                const QChar next = s.at(i);
                if (isBaseTokenChar(next)) {
                    token.append(next);
                    ++i;
                    continue;
                }
                // A connector joins only when flanked by word characters.
                if (isInnerConnector(next) && i + 1 < n
                    && isBaseTokenChar(token.back()) && isBaseTokenChar(s.at(i + 1))) {
                    token.append(next);
                    ++i;
                    continue;
                }
                break;
            }

            addToken(out, token);
            continue;
        }

        ++i;
    }

    if (out.empty()) {
        return out;
    }

    const auto dedupe = [](std::vector<QString>& tokens) {
        QSet<QString> seen;
        std::vector<QString> kept;
        kept.reserve(tokens.size());
        for (QString& t : tokens) {
            if (!seen.contains(t)) {
                seen.insert(t);
                kept.push_back(std::move(t));
            }
        }
        tokens = std::move(kept);
    };

    if (m_config.unique) {
        dedupe(out);
    }

    if (m_config.emitBigrams && out.size() >= 2) {
        const size_t base = out.size();
        for (size_t k = 0; k + 1 < base; ++k) {
            out.push_back(m_config.bigramPrefix + out[k] + QLatin1Char('_') + out[k + 1]);
        }
        if (m_config.unique) {
            dedupe(out);
        }
    }

    return out;
}

} // namespace fr
