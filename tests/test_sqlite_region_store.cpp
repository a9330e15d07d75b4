#include "ocl_gaiasync/logger.h"
#include "ocl_gaiasync/sqlite_region_store.h"
#include <gtest/gtest.h>
#include <sqlite3.h>
#include <cstdio>

using namespace ocl::gaiasync;

namespace {

const SchemaDescriptor& testSchema() {
    static const SchemaDescriptor schema("test_source", "gaiadr2.gaia_source",
                                         {{"designation", ColumnType::TEXT, true},
                                          {"source_id", ColumnType::INTEGER},
                                          {"ra", ColumnType::REAL},
                                          {"dec", ColumnType::REAL},
                                          {"duplicated_source", ColumnType::BOOLEAN}});
    return schema;
}

CatalogRecord makeRecord(SourceId id, const char* duplicated = "false") {
    CatalogRecord record;
    record.source_id = id;
    record.values = {std::string("Gaia DR2 ") + std::to_string(id),
                     std::to_string(id),
                     std::string("56.75"),
                     std::string("24.11"),
                     duplicated ? std::optional<std::string>(duplicated) : std::nullopt};
    return record;
}

RecordBatch makeBatch(SourceId first, size_t n) {
    RecordBatch batch;
    for (size_t i = 0; i < n; ++i) {
        batch.records.push_back(makeRecord(first + static_cast<SourceId>(i)));
    }
    return batch;
}

class SqliteRegionStoreTest : public ::testing::Test {
protected:
    Logger logger{LogLevel::SILENT};
    SqliteRegionStore store{":memory:", testSchema(), logger, 3};
};

} // namespace

TEST_F(SqliteRegionStoreTest, SaveRegionAssignsSerial) {
    Region m45("M45", EquatorialCoordinates(56.75, 24.1167), Circular{120.0}, {{"g1_class", "1"}});

    int64_t serial = store.saveRegion(m45);

    EXPECT_GT(serial, 0);
    ASSERT_TRUE(m45.serial().has_value());
    EXPECT_EQ(*m45.serial(), serial);
}

TEST_F(SqliteRegionStoreTest, SaveRegionIsAnUpsertByName) {
    Region first("NGC 752", EquatorialCoordinates(29.225, 37.7833), Circular{75.0},
                 {{"g1_class", "1"}});
    Region again("NGC 752", EquatorialCoordinates(29.225, 37.7833), Circular{75.0},
                 {{"g1_class", "2"}});

    int64_t serial = store.saveRegion(first);
    EXPECT_EQ(store.saveRegion(again), serial);

    auto regions = store.getRegions({"NGC 752"});
    ASSERT_EQ(regions.size(), 1u);
    const Region& stored = regions.at("NGC 752");
    EXPECT_EQ(stored.properties().at("g1_class"), "2");
    EXPECT_EQ(*stored.serial(), serial);
    EXPECT_TRUE(stored.sameGeometry(first));
}

TEST_F(SqliteRegionStoreTest, GeometryChangeIsRejected) {
    Region original("IC 2391", EquatorialCoordinates(130.05, -53.05), Circular{50.0},
                    {{"g1_class", "1"}});
    Region moved("IC 2391", EquatorialCoordinates(131.0, -53.05), Circular{50.0},
                 {{"g1_class", "9"}});
    Region reshaped("IC 2391", EquatorialCoordinates(130.05, -53.05), Rectangular{50.0, 50.0});

    store.saveRegion(original);

    for (Region* attempt : {&moved, &reshaped}) {
        try {
            store.saveRegion(*attempt);
            FAIL() << "Expected SyncException";
        } catch (const SyncException& e) {
            EXPECT_EQ(e.code(), ErrorCode::STORAGE_ERROR);
        }
        EXPECT_FALSE(attempt->serial().has_value());
    }

    // Rolled back: properties unchanged
    auto stored = store.getRegions({"IC 2391"}).at("IC 2391");
    EXPECT_EQ(stored.properties().at("g1_class"), "1");
    EXPECT_TRUE(stored.isCircular());
}

TEST_F(SqliteRegionStoreTest, RectangularRegionRoundTrip) {
    Region field("Field", EquatorialCoordinates(10.0, -5.0), Rectangular{30.0, 20.0});
    store.saveRegion(field);

    auto stored = store.getRegions().at("Field");
    ASSERT_FALSE(stored.isCircular());
    EXPECT_DOUBLE_EQ(std::get<Rectangular>(stored.shape()).width, 30.0);
    EXPECT_DOUBLE_EQ(std::get<Rectangular>(stored.shape()).height, 20.0);
}

TEST_F(SqliteRegionStoreTest, SaveRecordsSkipsDuplicates) {
    Region m45("M45", EquatorialCoordinates(56.75, 24.1167), Circular{120.0});
    int64_t serial = store.saveRegion(m45);

    // Chunk size is 3: 7 rows span three transactions
    SaveStats first = store.saveRecords(serial, makeBatch(100, 7));
    EXPECT_EQ(first.inserted, 7u);
    EXPECT_EQ(first.duplicates, 0u);

    SaveStats second = store.saveRecords(serial, makeBatch(105, 4));
    EXPECT_EQ(second.inserted, 2u);
    EXPECT_EQ(second.duplicates, 2u);

    EXPECT_EQ(store.countRecords("M45"), 9u);
}

TEST_F(SqliteRegionStoreTest, SameRecordInTwoRegions) {
    Region a("A", EquatorialCoordinates(1.0, 1.0), Circular{10.0});
    Region b("B", EquatorialCoordinates(1.0, 1.0), Circular{20.0});
    int64_t serial_a = store.saveRegion(a);
    int64_t serial_b = store.saveRegion(b);
    EXPECT_NE(serial_a, serial_b);

    EXPECT_EQ(store.saveRecords(serial_a, makeBatch(1, 3)).inserted, 3u);
    EXPECT_EQ(store.saveRecords(serial_b, makeBatch(1, 3)).inserted, 3u);

    EXPECT_EQ(store.countRecords("A"), 3u);
    EXPECT_EQ(store.countRecords("B"), 3u);
}

TEST_F(SqliteRegionStoreTest, KnownRecordIds) {
    Region m45("M45", EquatorialCoordinates(56.75, 24.1167), Circular{120.0});
    Region other("Other", EquatorialCoordinates(100.0, 10.0), Circular{10.0});

    // Never saved
    EXPECT_TRUE(store.getKnownRecordIds(m45).empty());

    int64_t serial = store.saveRegion(m45);
    store.saveRecords(serial, makeBatch(10, 4));
    store.saveRecords(store.saveRegion(other), makeBatch(50, 2));

    auto ids = store.getKnownRecordIds(m45);
    EXPECT_EQ(ids, (std::unordered_set<SourceId>{10, 11, 12, 13}));
}

TEST_F(SqliteRegionStoreTest, RegionIds) {
    Region a("A", EquatorialCoordinates(1.0, 1.0), Circular{10.0});
    int64_t serial = store.saveRegion(a);

    auto ids = store.getRegionIds({"A", "Missing"});
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids.at("A"), serial);
}

TEST_F(SqliteRegionStoreTest, FailedChunkIsRolledBack) {
    Region m45("M45", EquatorialCoordinates(56.75, 24.1167), Circular{120.0});
    int64_t serial = store.saveRegion(m45);

    // designation is NOT NULL: the third row aborts the first chunk
    RecordBatch batch = makeBatch(1, 3);
    batch.records[2].values[0].reset();

    try {
        store.saveRecords(serial, batch);
        FAIL() << "Expected SyncException";
    } catch (const SyncException& e) {
        EXPECT_EQ(e.code(), ErrorCode::STORAGE_ERROR);
    }
    EXPECT_EQ(store.countRecords("M45"), 0u);

    // Store still usable afterwards
    EXPECT_EQ(store.saveRecords(serial, makeBatch(1, 3)).inserted, 3u);
}

TEST_F(SqliteRegionStoreTest, RecordsNeedAStoredRegion) {
    EXPECT_THROW(store.saveRecords(12345, makeBatch(1, 1)), SyncException);
}

TEST_F(SqliteRegionStoreTest, WrongValueCountIsRejected) {
    Region m45("M45", EquatorialCoordinates(56.75, 24.1167), Circular{120.0});
    int64_t serial = store.saveRegion(m45);

    RecordBatch batch = makeBatch(1, 1);
    batch.records[0].values.pop_back();

    try {
        store.saveRecords(serial, batch);
        FAIL() << "Expected SyncException";
    } catch (const SyncException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_PARAMS);
    }
}

TEST(SqliteRegionStoreFileTest, ValuesAreStoredWithColumnTypes) {
    const std::string path = ::testing::TempDir() + "ocl_gaiasync_store_test.db";
    std::remove(path.c_str());

    {
        Logger logger(LogLevel::SILENT);
        SqliteRegionStore store(path, testSchema(), logger);
        Region m45("M45", EquatorialCoordinates(56.75, 24.1167), Circular{120.0});
        int64_t serial = store.saveRegion(m45);

        RecordBatch batch;
        batch.records.push_back(makeRecord(1, "true"));
        batch.records.push_back(makeRecord(2, nullptr));
        store.saveRecords(serial, batch);
    }

    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
    sqlite3_stmt* stmt = nullptr;
    ASSERT_EQ(sqlite3_prepare_v2(db,
        "SELECT typeof(ra), duplicated_source FROM test_source ORDER BY source_id",
        -1, &stmt, nullptr), SQLITE_OK);

    ASSERT_EQ(sqlite3_step(stmt), SQLITE_ROW);
    EXPECT_STREQ(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)), "real");
    EXPECT_EQ(sqlite3_column_int(stmt, 1), 1);

    ASSERT_EQ(sqlite3_step(stmt), SQLITE_ROW);
    EXPECT_EQ(sqlite3_column_type(stmt, 1), SQLITE_NULL);

    sqlite3_finalize(stmt);
    sqlite3_close(db);

    // Reopening keeps the data
    Logger logger(LogLevel::SILENT);
    SqliteRegionStore reopened(path, testSchema(), logger);
    EXPECT_EQ(reopened.countRecords("M45"), 2u);

    std::remove(path.c_str());
}

TEST(SqliteRegionStoreFileTest, BooleanTextIsCaseInsensitiveAndByteSafe) {
    const std::string path = ::testing::TempDir() + "ocl_gaiasync_boolean_test.db";
    std::remove(path.c_str());

    {
        Logger logger(LogLevel::SILENT);
        SqliteRegionStore store(path, testSchema(), logger);
        Region m45("M45", EquatorialCoordinates(56.75, 24.1167), Circular{120.0});
        int64_t serial = store.saveRegion(m45);

        RecordBatch batch;
        batch.records.push_back(makeRecord(1, "TRUE"));
        batch.records.push_back(makeRecord(2, "F"));
        batch.records.push_back(makeRecord(3, "\xC3\xA9t\xC3\xA9"));
        EXPECT_EQ(store.saveRecords(serial, batch).inserted, 3u);
    }

    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
    sqlite3_stmt* stmt = nullptr;
    ASSERT_EQ(sqlite3_prepare_v2(db,
        "SELECT typeof(duplicated_source), duplicated_source FROM test_source ORDER BY source_id",
        -1, &stmt, nullptr), SQLITE_OK);

    ASSERT_EQ(sqlite3_step(stmt), SQLITE_ROW);
    EXPECT_EQ(sqlite3_column_int(stmt, 1), 1);
    ASSERT_EQ(sqlite3_step(stmt), SQLITE_ROW);
    EXPECT_EQ(sqlite3_column_int(stmt, 1), 0);

    // Not a boolean spelling: kept as text
    ASSERT_EQ(sqlite3_step(stmt), SQLITE_ROW);
    EXPECT_STREQ(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)), "text");

    sqlite3_finalize(stmt);
    sqlite3_close(db);
    std::remove(path.c_str());
}
