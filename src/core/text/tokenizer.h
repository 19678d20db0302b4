#pragma once

#include <QString>

#include <vector>

namespace fr {

struct TokenizerConfig {
    int minTokenLength = 1;
    int maxTokenLength = 64;

    bool keepUrls = true;
    bool keepEmails = true;
    bool keepHashtags = true;
    bool keepMentions = true;

    // NFD + drop combining marks after NFKC lowercasing ("café" -> "cafe").
    bool stripDiacritics = false;

    // Appends "<bigramPrefix><a>_<b>" for every adjacent token pair.
    bool emitBigrams = false;
    QString bigramPrefix = QStringLiteral("bg:");

    // Drop repeated tokens, keeping the first occurrence.
    bool unique = false;
};

// Lexical tokenizer for retrieval scoring. Not a subword tokenizer: URLs,
// emails, #hashtags and @mentions come out as single tokens, and inner
// connectors survive inside words ("node.js", "it's", "snake_case").
//
// Stateless after construction; safe to share across threads.
class Tokenizer {
public:
    explicit Tokenizer(TokenizerConfig config = {});

    std::vector<QString> tokenize(const QString& text) const;

    const TokenizerConfig& config() const { return m_config; }

    // Letters and decimal digits only.
    static bool isBaseTokenChar(QChar ch);

private:
    static constexpr int kMaxNumericTokenLength = 12;
    static constexpr double kMaxSymbolRatio = 0.45;

    QString normalize(const QString& text) const;
    void addToken(std::vector<QString>& out, QString token) const;

    static bool passesQualityGate(const QString& token);
    static bool isInnerConnector(QChar ch);
    static bool isTrailingPunctuation(QChar ch);
    static bool isBreak(QChar ch);

    static bool looksLikeUrlStart(const QString& s, int i);
    static int consumeUrl(const QString& s, int i);
    static bool looksLikeEmailStart(const QString& s, int i);
    static int consumeEmail(const QString& s, int i);
    static int consumeTag(const QString& s, int i);
    static int consumeUntilBreak(const QString& s, int i);
    static int trimTrailingPunctuation(const QString& s, int begin, int end);

    TokenizerConfig m_config;
};

} // namespace fr
