#include <QtTest/QtTest>

#include "core/retrieval/in_memory_knowledge_base.h"

#include <limits>

class TestInMemoryKnowledgeBase : public QObject {
    Q_OBJECT

private slots:
    void testUpsertAndGet();
    void testUpsertRejectsBlank();
    void testUpsertReportsChange();
    void testInvalidWeightStoredAsOne();
    void testRemove();
    void testSnapshotSortedById();
};

void TestInMemoryKnowledgeBase::testUpsertAndGet()
{
    fr::InMemoryKnowledgeBase kb;
    QVERIFY(kb.upsert({QStringLiteral(" a "), QStringLiteral("alpha fact"), 2.0}));
    QCOMPARE(kb.size(), 1);

    const std::optional<fr::Statement> stored = kb.get(QStringLiteral("a"));
    QVERIFY(stored.has_value());
    QCOMPARE(stored->id, QStringLiteral("a"));
    QCOMPARE(stored->text, QStringLiteral("alpha fact"));
    QCOMPARE(stored->weight, 2.0);

    QVERIFY(!kb.get(QStringLiteral("missing")).has_value());
}

void TestInMemoryKnowledgeBase::testUpsertRejectsBlank()
{
    fr::InMemoryKnowledgeBase kb;
    QVERIFY(!kb.upsert({QString(), QStringLiteral("text"), 1.0}));
    QVERIFY(!kb.upsert({QStringLiteral("  "), QStringLiteral("text"), 1.0}));
    QVERIFY(!kb.upsert({QStringLiteral("a"), QStringLiteral("  \n"), 1.0}));
    QCOMPARE(kb.size(), 0);
}

void TestInMemoryKnowledgeBase::testUpsertReportsChange()
{
    fr::InMemoryKnowledgeBase kb;
    QVERIFY(kb.upsert({QStringLiteral("a"), QStringLiteral("alpha"), 1.0}));
    QVERIFY(!kb.upsert({QStringLiteral("a"), QStringLiteral("alpha"), 1.0}));
    QVERIFY(kb.upsert({QStringLiteral("a"), QStringLiteral("alpha v2"), 1.0}));
    QCOMPARE(kb.get(QStringLiteral("a"))->text, QStringLiteral("alpha v2"));
    QCOMPARE(kb.size(), 1);
}

void TestInMemoryKnowledgeBase::testInvalidWeightStoredAsOne()
{
    fr::InMemoryKnowledgeBase kb;
    QVERIFY(kb.upsert({QStringLiteral("n"), QStringLiteral("nan"),
                       std::numeric_limits<double>::quiet_NaN()}));
    QVERIFY(kb.upsert({QStringLiteral("m"), QStringLiteral("neg"), -2.0}));
    QVERIFY(kb.upsert({QStringLiteral("z"), QStringLiteral("zero"), 0.0}));
    QCOMPARE(kb.get(QStringLiteral("n"))->weight, 1.0);
    QCOMPARE(kb.get(QStringLiteral("m"))->weight, 1.0);
    QCOMPARE(kb.get(QStringLiteral("z"))->weight, 0.0);
}

void TestInMemoryKnowledgeBase::testRemove()
{
    fr::InMemoryKnowledgeBase kb;
    kb.upsert({QStringLiteral("a"), QStringLiteral("alpha"), 1.0});
    QVERIFY(kb.remove(QStringLiteral("a")));
    QVERIFY(!kb.remove(QStringLiteral("a")));
    QCOMPARE(kb.size(), 0);
}

void TestInMemoryKnowledgeBase::testSnapshotSortedById()
{
    fr::InMemoryKnowledgeBase kb;
    kb.upsert({QStringLiteral("c"), QStringLiteral("gamma"), 1.0});
    kb.upsert({QStringLiteral("a"), QStringLiteral("alpha"), 1.0});
    kb.upsert({QStringLiteral("b"), QStringLiteral("beta"), 1.0});

    const std::vector<fr::Statement> snapshot = kb.snapshotSorted();
    QCOMPARE(snapshot.size(), size_t(3));
    QCOMPARE(snapshot[0].id, QStringLiteral("a"));
    QCOMPARE(snapshot[1].id, QStringLiteral("b"));
    QCOMPARE(snapshot[2].id, QStringLiteral("c"));
}

QTEST_MAIN(TestInMemoryKnowledgeBase)
#include "test_in_memory_knowledge_base.moc"
