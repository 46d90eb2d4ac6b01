#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <sqlite3.h>

#include "core/index/record_store.h"
#include "core/vector/vector_store.h"

using lc::ParagraphLocation;
using lc::RecordStore;
using lc::VectorStore;

class TestVectorStore : public QObject {
    Q_OBJECT

private slots:
    void testNullDatabaseGuardClauses();
    void testAddAndLookup();
    void testAddReplacesExistingRow();
    void testRemoveAndClear();
    void testGetLocationsSkipsUnknown();
    void testRowsFollowStoreTransaction();
    void testDeleteAllClearsPayloads();
};

void TestVectorStore::testNullDatabaseGuardClauses()
{
    VectorStore store(nullptr);
    QVERIFY(!store.isReady());
    QVERIFY(!store.addPoint(1, ParagraphLocation{1, 1, 1}, "m"));
    QVERIFY(!store.removePoint(1));
    QVERIFY(!store.getLocation(1).has_value());
    QCOMPARE(store.countPoints(), 0);
    QVERIFY(store.allIds().empty());
    QVERIFY(!store.clearAll());
}

void TestVectorStore::testAddAndLookup()
{
    QTemporaryDir dir;
    auto db = RecordStore::open(dir.path() + "/payloads.db");
    QVERIFY(db.has_value());
    VectorStore store(db->rawDb());
    QVERIFY(store.isReady());

    QVERIFY(store.addPoint(5, ParagraphLocation{2, 3, 4}, "model-a"));
    QVERIFY(store.addPoint(9, ParagraphLocation{2, 3, 5}, "model-a"));

    const auto location = store.getLocation(5);
    QVERIFY(location.has_value());
    QVERIFY(*location == (ParagraphLocation{2, 3, 4}));
    QVERIFY(!store.getLocation(6).has_value());
    QCOMPARE(store.countPoints(), 2);
    QCOMPARE(store.allIds(), (std::vector<int64_t>{5, 9}));
}

void TestVectorStore::testAddReplacesExistingRow()
{
    QTemporaryDir dir;
    auto db = RecordStore::open(dir.path() + "/payloads.db");
    QVERIFY(db.has_value());
    VectorStore store(db->rawDb());

    QVERIFY(store.addPoint(5, ParagraphLocation{1, 1, 1}, "model-a"));
    QVERIFY(store.addPoint(5, ParagraphLocation{1, 1, 2}, "model-b"));
    QCOMPARE(store.countPoints(), 1);
    QVERIFY(*store.getLocation(5) == (ParagraphLocation{1, 1, 2}));

    sqlite3_stmt* stmt = nullptr;
    QCOMPARE(sqlite3_prepare_v2(db->rawDb(), "SELECT model_id FROM vector_points WHERE id = 5",
                                -1, &stmt, nullptr),
             SQLITE_OK);
    QCOMPARE(sqlite3_step(stmt), SQLITE_ROW);
    const QString model = QString::fromUtf8(
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    sqlite3_finalize(stmt);
    QCOMPARE(model, QStringLiteral("model-b"));
}

void TestVectorStore::testRemoveAndClear()
{
    QTemporaryDir dir;
    auto db = RecordStore::open(dir.path() + "/payloads.db");
    QVERIFY(db.has_value());
    VectorStore store(db->rawDb());

    for (int64_t id = 1; id <= 4; ++id) {
        QVERIFY(store.addPoint(id, ParagraphLocation{1, 1, id}, "m"));
    }
    QVERIFY(store.removePoint(2));
    QVERIFY(store.removePoint(42));
    QCOMPARE(store.allIds(), (std::vector<int64_t>{1, 3, 4}));

    QVERIFY(store.clearAll());
    QCOMPARE(store.countPoints(), 0);
}

void TestVectorStore::testGetLocationsSkipsUnknown()
{
    QTemporaryDir dir;
    auto db = RecordStore::open(dir.path() + "/payloads.db");
    QVERIFY(db.has_value());
    VectorStore store(db->rawDb());

    QVERIFY(store.addPoint(1, ParagraphLocation{7, 1, 1}, "m"));
    QVERIFY(store.addPoint(2, ParagraphLocation{7, 1, 2}, "m"));

    const auto locations = store.getLocations({2, 3, 1});
    QCOMPARE(locations.size(), size_t(2));
    QCOMPARE(locations.at(2).paragraphId, int64_t(2));
    QCOMPARE(locations.at(1).paragraphId, int64_t(1));
}

void TestVectorStore::testRowsFollowStoreTransaction()
{
    QTemporaryDir dir;
    auto db = RecordStore::open(dir.path() + "/payloads.db");
    QVERIFY(db.has_value());
    VectorStore store(db->rawDb());

    QVERIFY(db->beginTransaction());
    QVERIFY(store.addPoint(1, ParagraphLocation{1, 1, 1}, "m"));
    QVERIFY(db->rollbackTransaction());
    QCOMPARE(store.countPoints(), 0);

    QVERIFY(db->beginTransaction());
    QVERIFY(store.addPoint(1, ParagraphLocation{1, 1, 1}, "m"));
    QVERIFY(db->commitTransaction());
    QCOMPARE(store.countPoints(), 1);
}

void TestVectorStore::testDeleteAllClearsPayloads()
{
    QTemporaryDir dir;
    auto db = RecordStore::open(dir.path() + "/payloads.db");
    QVERIFY(db.has_value());
    VectorStore store(db->rawDb());

    QVERIFY(store.addPoint(1, ParagraphLocation{1, 1, 1}, "m"));
    QVERIFY(db->deleteAll());
    QCOMPARE(store.countPoints(), 0);
}

QTEST_MAIN(TestVectorStore)
#include "test_vector_store.moc"
