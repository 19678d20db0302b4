#include <QtTest/QtTest>

#include "core/shared/exploration_config.h"

#include <limits>

class TestExplorationConfig : public QObject {
    Q_OBJECT

private slots:
    void testDefaultsAreValid();
    void testOutOfRangeFieldsAreInvalid();
    void testSanitizedKeepsValidFields();
};

void TestExplorationConfig::testDefaultsAreValid()
{
    const fr::ExplorationConfig config;
    QVERIFY(config.isValid());
    QCOMPARE(config.iterations, 3);
    QCOMPARE(config.candidateGateMinTokenLen, 3);
    QCOMPARE(config.maxCandidatesPerIter, 120000);
    QCOMPARE(config.refineTerms, 14);
    QCOMPARE(config.iterationDecay, 0.72);
    QCOMPARE(config.qualityFloor, 0.0);
}

void TestExplorationConfig::testOutOfRangeFieldsAreInvalid()
{
    fr::ExplorationConfig config;
    config.iterations = 0;
    QVERIFY(!config.isValid());

    config = {};
    config.iterationDecay = 0.0;
    QVERIFY(!config.isValid());

    config = {};
    config.iterationDecay = 1.5;
    QVERIFY(!config.isValid());

    config = {};
    config.minScore = std::numeric_limits<double>::quiet_NaN();
    QVERIFY(!config.isValid());

    config = {};
    config.refineTerms = -1;
    QVERIFY(!config.isValid());

    config = {};
    config.refineTerms = 0;
    config.iterationDecay = 1.0;
    QVERIFY(config.isValid());
}

void TestExplorationConfig::testSanitizedKeepsValidFields()
{
    fr::ExplorationConfig config;
    config.iterations = -4;
    config.maxCandidatesPerIter = 0;
    config.refineTerms = 5;
    config.qualityFloor = 0.3;

    const fr::ExplorationConfig fixed = config.sanitized();
    QVERIFY(fixed.isValid());
    QCOMPARE(fixed.iterations, 3);
    QCOMPARE(fixed.maxCandidatesPerIter, 120000);
    QCOMPARE(fixed.refineTerms, 5);
    QCOMPARE(fixed.qualityFloor, 0.3);
}

QTEST_MAIN(TestExplorationConfig)
#include "test_exploration_config.moc"
