#include <QtTest/QtTest>

#include "core/ranking/token_overlap_scorer.h"
#include "core/text/tokenizer.h"

#include <cmath>
#include <limits>

namespace {

fr::Statement statement(const QString& id, const QString& text, double weight = 1.0)
{
    return fr::Statement{id, text, weight};
}

std::vector<fr::Statement> rustCorpus()
{
    return {
        statement(QStringLiteral("a"), QStringLiteral("rust ownership model prevents data races")),
        statement(QStringLiteral("b"), QStringLiteral("garbage collection simplifies memory management")),
        statement(QStringLiteral("c"), QStringLiteral("ownership and borrowing in rust")),
    };
}

} // namespace

class TestTokenOverlapScorer : public QObject {
    Q_OBJECT

private slots:
    void testIdenticalTextScoresOne();
    void testNoOverlapScoresZero();
    void testBlankInputsScoreZero();
    void testZeroWeightScoresZero();
    void testWeightScalesScore();
    void testShortTokensIgnored();
    void testPrepareBuildsIdf();
    void testPrepareRunsOnce();
    void testRareTokenOutweighsCommonToken();
    void testTokensCachedByIdentity();
    void testScoresAreFiniteAndNonNegative();

private:
    fr::Tokenizer m_tokenizer;
};

void TestTokenOverlapScorer::testIdenticalTextScoresOne()
{
    fr::TokenOverlapScorer scorer(m_tokenizer);
    const fr::Statement s = statement(QStringLiteral("a"), QStringLiteral("rust ownership model"));
    QVERIFY(std::abs(scorer.score(QStringLiteral("Rust ownership MODEL"), s) - 1.0) < 1e-9);
}

void TestTokenOverlapScorer::testNoOverlapScoresZero()
{
    fr::TokenOverlapScorer scorer(m_tokenizer);
    const std::vector<fr::Statement> corpus = rustCorpus();
    QCOMPARE(scorer.score(QStringLiteral("rust ownership"), corpus[1]), 0.0);
}

void TestTokenOverlapScorer::testBlankInputsScoreZero()
{
    fr::TokenOverlapScorer scorer(m_tokenizer);
    QCOMPARE(scorer.score(QString(), rustCorpus()[0]), 0.0);
    QCOMPARE(scorer.score(QStringLiteral("   "), rustCorpus()[0]), 0.0);
    QCOMPARE(scorer.score(QStringLiteral("rust"), statement(QStringLiteral("x"), QStringLiteral(" "))),
             0.0);
}

void TestTokenOverlapScorer::testZeroWeightScoresZero()
{
    fr::TokenOverlapScorer scorer(m_tokenizer);
    const fr::Statement s =
        statement(QStringLiteral("z"), QStringLiteral("rust ownership model"), 0.0);
    QCOMPARE(scorer.score(QStringLiteral("rust ownership model"), s), 0.0);

    const fr::Statement negative =
        statement(QStringLiteral("n"), QStringLiteral("rust ownership model"), -3.0);
    QCOMPARE(scorer.score(QStringLiteral("rust ownership model"), negative), 0.0);
}

void TestTokenOverlapScorer::testWeightScalesScore()
{
    fr::TokenOverlapScorer scorer(m_tokenizer);
    const fr::Statement unit = statement(QStringLiteral("u"), QStringLiteral("rust ownership"));
    const fr::Statement half = statement(QStringLiteral("h"), QStringLiteral("rust ownership"), 0.5);
    const double full = scorer.score(QStringLiteral("rust"), unit);
    QVERIFY(full > 0.0);
    QVERIFY(std::abs(scorer.score(QStringLiteral("rust"), half) - full * 0.5) < 1e-12);

    const fr::Statement nanWeight = statement(QStringLiteral("w"), QStringLiteral("rust ownership"),
                                              std::numeric_limits<double>::quiet_NaN());
    QVERIFY(std::abs(scorer.score(QStringLiteral("rust"), nanWeight) - full) < 1e-12);
}

void TestTokenOverlapScorer::testShortTokensIgnored()
{
    fr::TokenOverlapScorer scorer(m_tokenizer);
    const fr::Statement s = statement(QStringLiteral("s"), QStringLiteral("go is ok"));
    QCOMPARE(scorer.score(QStringLiteral("go is ok"), s), 0.0);

    const std::optional<std::vector<QString>> tokens = scorer.tokens(s);
    QVERIFY(tokens.has_value());
    QVERIFY(tokens->empty());
}

void TestTokenOverlapScorer::testPrepareBuildsIdf()
{
    fr::TokenOverlapScorer scorer(m_tokenizer);
    QVERIFY(!scorer.isPrepared());
    QCOMPARE(scorer.idf(QStringLiteral("rust")), 1.0);

    std::vector<fr::Statement> corpus = rustCorpus();
    corpus.push_back(statement(QStringLiteral("blank"), QStringLiteral("   ")));
    scorer.prepare(corpus);

    QVERIFY(scorer.isPrepared());
    // N = 3 non-blank documents; "rust" appears in 2, "garbage" in 1.
    QVERIFY(std::abs(scorer.idf(QStringLiteral("rust")) - (std::log(4.0 / 3.0) + 1.0)) < 1e-12);
    QVERIFY(std::abs(scorer.idf(QStringLiteral("garbage")) - (std::log(4.0 / 2.0) + 1.0)) < 1e-12);
    QCOMPARE(scorer.idf(QStringLiteral("unseen")), 1.0);
    QVERIFY(scorer.vocabularySize() > 0);
}

void TestTokenOverlapScorer::testPrepareRunsOnce()
{
    fr::TokenOverlapScorer scorer(m_tokenizer);
    scorer.prepare(rustCorpus());
    const int vocabulary = scorer.vocabularySize();
    const double rustIdf = scorer.idf(QStringLiteral("rust"));

    scorer.prepare({statement(QStringLiteral("x"), QStringLiteral("completely different words here"))});
    QCOMPARE(scorer.vocabularySize(), vocabulary);
    QCOMPARE(scorer.idf(QStringLiteral("rust")), rustIdf);
    QCOMPARE(scorer.idf(QStringLiteral("completely")), 1.0);
}

void TestTokenOverlapScorer::testRareTokenOutweighsCommonToken()
{
    fr::TokenOverlapScorer scorer(m_tokenizer);
    const std::vector<fr::Statement> corpus = {
        statement(QStringLiteral("1"), QStringLiteral("common rare")),
        statement(QStringLiteral("2"), QStringLiteral("common other")),
        statement(QStringLiteral("3"), QStringLiteral("common third")),
        statement(QStringLiteral("4"), QStringLiteral("common fourth")),
    };
    scorer.prepare(corpus);

    const fr::Statement onlyRare = statement(QStringLiteral("r"), QStringLiteral("rare filler"));
    const fr::Statement onlyCommon = statement(QStringLiteral("c"), QStringLiteral("common filler"));
    QVERIFY(scorer.score(QStringLiteral("common rare"), onlyRare)
            > scorer.score(QStringLiteral("common rare"), onlyCommon));
}

void TestTokenOverlapScorer::testTokensCachedByIdentity()
{
    fr::TokenOverlapScorer scorer(m_tokenizer);
    const fr::Statement s = statement(QStringLiteral("k"), QStringLiteral("Ownership and borrowing"));
    const std::optional<std::vector<QString>> first = scorer.tokens(s);
    QVERIFY(first.has_value());
    const std::vector<QString> expected = {
        QStringLiteral("ownership"), QStringLiteral("and"), QStringLiteral("borrowing")};
    QCOMPARE(*first, expected);

    // Same id, different text: the cache is keyed by identity and append-only.
    const fr::Statement renamed = statement(QStringLiteral("k"), QStringLiteral("something else"));
    QCOMPARE(*scorer.tokens(renamed), expected);
}

void TestTokenOverlapScorer::testScoresAreFiniteAndNonNegative()
{
    fr::TokenOverlapScorer scorer(m_tokenizer);
    std::vector<fr::Statement> corpus = rustCorpus();
    corpus.push_back(statement(QStringLiteral("d"), QStringLiteral("rust rust rust"), 1e308));
    corpus.push_back(statement(QStringLiteral("e"), QStringLiteral("!!! ???"), 1.0));
    scorer.prepare(corpus);

    const QStringList queries = {
        QStringLiteral("rust"), QStringLiteral("memory data"), QStringLiteral("!!!"),
        QStringLiteral("rust ownership borrowing races garbage")};
    for (const QString& q : queries) {
        for (const fr::Statement& s : corpus) {
            const double v = scorer.score(q, s);
            QVERIFY(std::isfinite(v));
            QVERIFY(v >= 0.0);
        }
    }
}

QTEST_MAIN(TestTokenOverlapScorer)
#include "test_token_overlap_scorer.moc"
