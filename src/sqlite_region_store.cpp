#include "ocl_gaiasync/sqlite_region_store.h"
#include "ocl_gaiasync/logger.h"
#include "ocl_gaiasync/simple_json.h"
#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <type_traits>

namespace ocl {
namespace gaiasync {

namespace {

// Finalizes the statement when leaving scope
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string error = sqlite3_errmsg(db);
            throw SyncException(ErrorCode::STORAGE_ERROR,
                                "Failed to prepare statement: " + error);
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

    void bindText(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT);
    }

    // SQLITE_ROW or SQLITE_DONE, anything else throws
    int step() {
        int rc = sqlite3_step(stmt_);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
            throw SyncException(ErrorCode::STORAGE_ERROR,
                                std::string("SQLite step failed: ") + sqlite3_errmsg(db_));
        }
        return rc;
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// Rolls back unless commit() was reached
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        run("BEGIN IMMEDIATE");
    }

    ~Transaction() {
        if (!committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        run("COMMIT");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_ = false;

    void run(const char* sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string error = err ? err : "unknown error";
            sqlite3_free(err);
            throw SyncException(ErrorCode::STORAGE_ERROR,
                                std::string(sql) + " failed: " + error);
        }
    }
};

const char* sqlType(ColumnType type) {
    switch (type) {
        case ColumnType::INTEGER: return "INTEGER";
        case ColumnType::REAL: return "REAL";
        case ColumnType::BOOLEAN: return "INTEGER";
        case ColumnType::TEXT: return "TEXT";
    }
    return "TEXT";
}

// Bind a textual value using the column's storage class. Values that do not
// parse are kept as text and left to SQLite's type affinity.
void bindValue(sqlite3_stmt* stmt, int index, ColumnType type, const std::string& value) {
    switch (type) {
        case ColumnType::INTEGER: {
            char* end = nullptr;
            long long v = std::strtoll(value.c_str(), &end, 10);
            if (end && *end == '\0') {
                sqlite3_bind_int64(stmt, index, v);
                return;
            }
            break;
        }
        case ColumnType::REAL: {
            char* end = nullptr;
            double v = std::strtod(value.c_str(), &end);
            if (end && *end == '\0') {
                sqlite3_bind_double(stmt, index, v);
                return;
            }
            break;
        }
        case ColumnType::BOOLEAN: {
            std::string lower = value;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
            if (lower == "true" || lower == "t" || lower == "1") {
                sqlite3_bind_int(stmt, index, 1);
                return;
            }
            if (lower == "false" || lower == "f" || lower == "0") {
                sqlite3_bind_int(stmt, index, 0);
                return;
            }
            break;
        }
        case ColumnType::TEXT:
            break;
    }
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// Columns: name, ra, dec, diam, width, height, properties
Region rowToRegion(sqlite3_stmt* stmt, int first_col) {
    std::string name = columnText(stmt, first_col);
    EquatorialCoordinates coords(sqlite3_column_double(stmt, first_col + 1),
                                 sqlite3_column_double(stmt, first_col + 2));

    Shape shape;
    if (sqlite3_column_type(stmt, first_col + 3) != SQLITE_NULL) {
        shape = Circular{sqlite3_column_double(stmt, first_col + 3)};
    } else {
        shape = Rectangular{sqlite3_column_double(stmt, first_col + 4),
                            sqlite3_column_double(stmt, first_col + 5)};
    }

    RegionProperties properties;
    std::string json = columnText(stmt, first_col + 6);
    if (!json.empty()) {
        properties = SimpleJSON::parse(json);
    }

    return Region(std::move(name), coords, shape, std::move(properties));
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

SqliteRegionStore::SqliteRegionStore(const std::string& db_path,
                                     const SchemaDescriptor& schema,
                                     Logger& logger,
                                     size_t chunk_size)
    : db_path_(db_path), schema_(schema), logger_(logger), chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw SyncException(ErrorCode::INVALID_PARAMS, "chunk_size must be positive");
    }
    if (!SchemaDescriptor::isSafeIdentifier(schema_.storeTable())) {
        throw SyncException(ErrorCode::INVALID_PARAMS,
                            "Invalid store table name: " + schema_.storeTable());
    }

    std::ostringstream insert;
    insert << "INSERT INTO " << schema_.storeTable() << " (region_id";
    for (const auto& col : schema_.columns()) {
        insert << ", " << col.name;
    }
    insert << ") VALUES (?";
    for (size_t i = 0; i < schema_.columns().size(); ++i) {
        insert << ", ?";
    }
    insert << ") ON CONFLICT (region_id, " << schema_.idColumn() << ") DO NOTHING";
    insert_records_sql_ = insert.str();

    openDatabase();
    try {
        ensureSchema();
    } catch (...) {
        closeDatabase();
        throw;
    }
}

SqliteRegionStore::~SqliteRegionStore() {
    closeDatabase();
}

void SqliteRegionStore::openDatabase() {
    int rc = sqlite3_open_v2(db_path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        closeDatabase();
        throw SyncException(ErrorCode::STORAGE_ERROR,
                            "Failed to open region store '" + db_path_ + "': " + error);
    }
    sqlite3_busy_timeout(db_, 5000);
    logger_.debug("Opened region store " + db_path_);
}

void SqliteRegionStore::closeDatabase() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteRegionStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string error = err ? err : "unknown error";
        sqlite3_free(err);
        throw SyncException(ErrorCode::STORAGE_ERROR, "SQLite error: " + error);
    }
}

void SqliteRegionStore::ensureSchema() {
    exec("PRAGMA foreign_keys = ON");

    exec("CREATE TABLE IF NOT EXISTS regions ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT, "
         "name TEXT NOT NULL UNIQUE, "
         "ra REAL NOT NULL, "
         "dec REAL NOT NULL, "
         "diam REAL, "
         "width REAL, "
         "height REAL, "
         "properties TEXT, "
         "CHECK ((diam IS NOT NULL AND width IS NULL AND height IS NULL) OR "
         "(diam IS NULL AND width IS NOT NULL AND height IS NOT NULL)))");

    std::ostringstream records;
    records << "CREATE TABLE IF NOT EXISTS " << schema_.storeTable() << " ("
            << "region_id INTEGER NOT NULL REFERENCES regions (id) ON DELETE CASCADE";
    for (const auto& col : schema_.columns()) {
        records << ", " << col.name << " " << sqlType(col.type);
        if (col.not_null || col.name == schema_.idColumn()) {
            records << " NOT NULL";
        }
    }
    records << ", PRIMARY KEY (region_id, " << schema_.idColumn() << "))";
    exec(records.str());
}

// =============================================================================
// Regions
// =============================================================================

int64_t SqliteRegionStore::saveRegion(Region& region) {
    std::lock_guard<std::mutex> lock(mutex_);

    Transaction tx(db_);

    // On conflict only the properties change; RETURNING yields the stored
    // geometry so a mismatch can be detected before committing.
    Statement stmt(db_,
        "INSERT INTO regions (name, ra, dec, diam, width, height, properties) "
        "VALUES (?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT (name) DO UPDATE SET properties = excluded.properties "
        "RETURNING id, name, ra, dec, diam, width, height, properties");

    stmt.bindText(1, region.name());
    sqlite3_bind_double(stmt.get(), 2, region.coords().ra);
    sqlite3_bind_double(stmt.get(), 3, region.coords().dec);

    std::visit([&stmt](const auto& shape) {
        using T = std::decay_t<decltype(shape)>;
        if constexpr (std::is_same_v<T, Circular>) {
            sqlite3_bind_double(stmt.get(), 4, shape.diam);
        } else {
            sqlite3_bind_double(stmt.get(), 5, shape.width);
            sqlite3_bind_double(stmt.get(), 6, shape.height);
        }
    }, region.shape());

    stmt.bindText(7, SimpleJSON::serialize(region.properties()));

    if (stmt.step() != SQLITE_ROW) {
        throw SyncException(ErrorCode::STORAGE_ERROR,
                            "Upsert of region '" + region.name() + "' returned no row");
    }

    int64_t serial = sqlite3_column_int64(stmt.get(), 0);
    Region stored = rowToRegion(stmt.get(), 1);

    // Drain RETURNING before committing
    while (stmt.step() == SQLITE_ROW) {
    }

    if (!stored.sameGeometry(region)) {
        throw SyncException(ErrorCode::STORAGE_ERROR,
                            "Region '" + region.name() +
                            "' already stored with different coordinates or shape");
    }

    tx.commit();

    region.assignSerial(serial);
    logger_.debug("Saved region " + region.name() + " (id " + std::to_string(serial) + ")");
    return serial;
}

std::map<std::string, int64_t> SqliteRegionStore::getRegionIds(const std::set<std::string>& names) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, int64_t> ids;
    Statement stmt(db_, "SELECT id FROM regions WHERE name = ?");
    for (const auto& name : names) {
        stmt.reset();
        stmt.bindText(1, name);
        if (stmt.step() == SQLITE_ROW) {
            ids[name] = sqlite3_column_int64(stmt.get(), 0);
        }
    }
    return ids;
}

std::map<std::string, Region> SqliteRegionStore::getRegions(const std::set<std::string>& names) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, Region> regions;
    Statement stmt(db_,
        "SELECT id, name, ra, dec, diam, width, height, properties FROM regions ORDER BY name");

    while (stmt.step() == SQLITE_ROW) {
        std::string name = columnText(stmt.get(), 1);
        if (!names.empty() && names.count(name) == 0) {
            continue;
        }
        Region region = rowToRegion(stmt.get(), 1);
        region.assignSerial(sqlite3_column_int64(stmt.get(), 0));
        regions.emplace(name, std::move(region));
    }
    return regions;
}

// =============================================================================
// Records
// =============================================================================

SaveStats SqliteRegionStore::saveRecords(int64_t region_serial, const RecordBatch& batch) {
    SaveStats stats;
    if (batch.empty()) {
        return stats;
    }

    const size_t num_columns = schema_.columns().size();
    for (const auto& record : batch.records) {
        if (record.values.size() != num_columns) {
            throw SyncException(ErrorCode::INVALID_PARAMS,
                                "Record " + std::to_string(record.source_id) + " has " +
                                std::to_string(record.values.size()) + " values, expected " +
                                std::to_string(num_columns));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);

    for (size_t begin = 0; begin < batch.size(); begin += chunk_size_) {
        size_t end = std::min(begin + chunk_size_, batch.size());
        stats.inserted += insertChunk(region_serial, batch, begin, end);
    }
    stats.duplicates = batch.size() - stats.inserted;

    logger_.debug("Region id " + std::to_string(region_serial) + ": inserted " +
                  std::to_string(stats.inserted) + " records, skipped " +
                  std::to_string(stats.duplicates) + " duplicates");
    return stats;
}

size_t SqliteRegionStore::insertChunk(int64_t region_serial, const RecordBatch& batch,
                                      size_t begin, size_t end) {
    Transaction tx(db_);
    Statement stmt(db_, insert_records_sql_);

    const auto& columns = schema_.columns();
    const size_t id_index = schema_.idColumnIndex();
    size_t inserted = 0;

    for (size_t r = begin; r < end; ++r) {
        const auto& record = batch.records[r];
        stmt.reset();
        sqlite3_bind_int64(stmt.get(), 1, region_serial);

        for (size_t c = 0; c < columns.size(); ++c) {
            int index = static_cast<int>(c) + 2;
            if (c == id_index) {
                sqlite3_bind_int64(stmt.get(), index, record.source_id);
            } else if (record.values[c].has_value()) {
                bindValue(stmt.get(), index, columns[c].type, *record.values[c]);
            } else {
                sqlite3_bind_null(stmt.get(), index);
            }
        }

        stmt.step();
        inserted += static_cast<size_t>(sqlite3_changes(db_));
    }

    tx.commit();
    return inserted;
}

std::unordered_set<SourceId> SqliteRegionStore::getKnownRecordIds(const Region& region) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_,
        "SELECT s." + schema_.idColumn() + " FROM " + schema_.storeTable() + " s "
        "JOIN regions r ON s.region_id = r.id WHERE r.name = ?");
    stmt.bindText(1, region.name());

    std::unordered_set<SourceId> ids;
    while (stmt.step() == SQLITE_ROW) {
        ids.insert(sqlite3_column_int64(stmt.get(), 0));
    }
    return ids;
}

size_t SqliteRegionStore::countRecords(const std::string& region_name) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_,
        "SELECT COUNT(*) FROM " + schema_.storeTable() + " s "
        "JOIN regions r ON s.region_id = r.id WHERE r.name = ?");
    stmt.bindText(1, region_name);

    size_t count = 0;
    if (stmt.step() == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    }
    return count;
}

} // namespace gaiasync
} // namespace ocl
