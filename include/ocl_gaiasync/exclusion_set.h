#pragma once

#include "types.h"
#include "query_builder.h"
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace ocl {
namespace gaiasync {

class Logger;
class RegionStore;
class RemoteCatalogService;

/**
 * Scoped exclusion filter for one remote query.
 *
 * When the filter refers to an uploaded table, the lease owns that table:
 * it is deleted by release() or, at the latest, by the destructor. Deletion
 * failures are logged as ARTIFACT_CLEANUP_ERROR and never thrown. While a
 * remote table exists the lease also holds the session artifact mutex, so
 * create, query and delete of artifacts never interleave between workers.
 */
class ExclusionLease {
public:
    ExclusionLease() = default;
    ~ExclusionLease();

    // No copy, allow move
    ExclusionLease(const ExclusionLease&) = delete;
    ExclusionLease& operator=(const ExclusionLease&) = delete;
    ExclusionLease(ExclusionLease&& other) noexcept;
    ExclusionLease& operator=(ExclusionLease&& other) noexcept;

    const ExclusionFilter& filter() const { return filter_; }

    bool ownsRemoteTable() const { return service_ != nullptr; }

    /**
     * Delete the remote table now (no-op for inline or empty filters)
     */
    void release();

private:
    friend class ExclusionSetManager;

    ExclusionFilter filter_;
    RemoteCatalogService* service_ = nullptr;
    Logger* logger_ = nullptr;
    std::string table_name_;
    std::unique_lock<std::mutex> artifact_lock_;
};

/**
 * ExclusionSetManager - Identifiers already known for one region
 *
 * The set is rebuilt from the store at the beginning of every run and grows
 * as partitions are downloaded. Before each query, prepare() turns it into
 * the cheapest filter the session allows:
 * - empty set: no filter
 * - authenticated session: uploaded table "ocl_<hash>" joined by the query
 * - anonymous session, or upload refused: inline NOT IN list
 *
 * The remote table name is derived from the region name only, so a table
 * left behind by an interrupted run is overwritten by the next one.
 */
class ExclusionSetManager {
public:
    static constexpr size_t kDefaultInlineWarnThreshold = 10000;

    /**
     * @param region Region the identifiers belong to
     * @param logger Logger
     * @param inline_warn_threshold Warn when an inline list grows beyond this
     */
    ExclusionSetManager(const Region& region, Logger& logger,
                        size_t inline_warn_threshold = kDefaultInlineWarnThreshold);

    /**
     * Load the identifiers already persisted for the region
     * @throws SyncException (STORAGE_ERROR) if the store cannot be read
     */
    void initialize(RegionStore& store);

    /**
     * Add identifiers to the set
     * @return Number of identifiers that were not known yet
     */
    size_t absorb(const std::vector<SourceId>& ids);

    /**
     * Build the filter for the next query
     *
     * @param service Remote service used for the upload
     * @param authenticated Whether the session allows user tables
     * @param artifact_mutex Session-wide mutex serializing artifact use (optional)
     */
    ExclusionLease prepare(RemoteCatalogService& service, bool authenticated,
                           std::mutex* artifact_mutex = nullptr);

    size_t size() const { return ids_.size(); }
    bool empty() const { return ids_.empty(); }
    bool contains(SourceId id) const { return ids_.count(id) > 0; }

    /**
     * Identifiers in ascending order
     */
    std::vector<SourceId> sortedIds() const;

    const std::string& artifactName() const { return artifact_name_; }

    /**
     * Remote table name for a region: "ocl_" + 16 hex digits (CRC-32 and
     * Adler-32 of the region name)
     */
    static std::string artifactNameFor(const std::string& region_name);

private:
    Region region_;
    std::string artifact_name_;
    Logger& logger_;
    size_t inline_warn_threshold_;
    std::unordered_set<SourceId> ids_;
};

} // namespace gaiasync
} // namespace ocl
