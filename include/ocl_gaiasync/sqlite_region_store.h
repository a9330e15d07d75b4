#pragma once

#include "region_store.h"
#include "schema_descriptor.h"
#include <map>
#include <mutex>
#include <set>
#include <string>

struct sqlite3;

namespace ocl {
namespace gaiasync {

class Logger;

/**
 * @brief Region store backed by an SQLite database
 *
 * Two tables are used:
 * - regions: id (serial), unique name, ra, dec, diam | width + height
 *   [arcmin], properties (JSON text)
 * - <schema store table>: region_id + every schema column, primary key
 *   (region_id, source_id)
 *
 * Upserts rely on SQLite's native ON CONFLICT clause. Record batches are
 * written in chunks, one transaction per chunk.
 *
 * The store owns a single connection; calls are serialized so the store can
 * be shared by concurrent region workers.
 */
class SqliteRegionStore : public RegionStore {
public:
    static constexpr size_t kDefaultChunkSize = 50000;

    /**
     * @brief Open (and create if needed) the database and its tables
     * @param db_path Path to the SQLite database file, ":memory:" for a private in-memory store
     * @param schema Record columns
     * @param logger Logger for debug output
     * @param chunk_size Rows per insert transaction
     * @throws SyncException (STORAGE_ERROR) if the database cannot be opened or initialized
     */
    SqliteRegionStore(const std::string& db_path,
                      const SchemaDescriptor& schema,
                      Logger& logger,
                      size_t chunk_size = kDefaultChunkSize);

    ~SqliteRegionStore() override;

    // Disable copy
    SqliteRegionStore(const SqliteRegionStore&) = delete;
    SqliteRegionStore& operator=(const SqliteRegionStore&) = delete;

    int64_t saveRegion(Region& region) override;
    SaveStats saveRecords(int64_t region_serial, const RecordBatch& batch) override;
    std::unordered_set<SourceId> getKnownRecordIds(const Region& region) override;

    /**
     * @brief Serials of the named regions that are stored
     */
    std::map<std::string, int64_t> getRegionIds(const std::set<std::string>& names);

    /**
     * @brief Rebuild stored regions (all of them when names is empty)
     */
    std::map<std::string, Region> getRegions(const std::set<std::string>& names = {});

    /**
     * @brief Number of records stored for a region
     */
    size_t countRecords(const std::string& region_name);

    size_t chunkSize() const { return chunk_size_; }

private:
    sqlite3* db_ = nullptr;
    std::string db_path_;
    const SchemaDescriptor& schema_;
    Logger& logger_;
    size_t chunk_size_;
    std::string insert_records_sql_;
    std::mutex mutex_;

    void openDatabase();
    void closeDatabase();
    void ensureSchema();
    void exec(const std::string& sql);

    size_t insertChunk(int64_t region_serial, const RecordBatch& batch, size_t begin, size_t end);
};

} // namespace gaiasync
} // namespace ocl
