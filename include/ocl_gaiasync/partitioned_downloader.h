#pragma once

#include "types.h"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace ocl {
namespace gaiasync {

class ExclusionSetManager;
class Logger;
class RegionStore;
class SessionManager;
class SpatialQueryBuilder;

/**
 * Downloader states. DONE, EMPTY, FAILED and CANCELLED are terminal.
 */
enum class DownloadState {
    IDLE,
    FETCHING,
    SAVED,
    EMPTY,
    FAILED,
    DONE,
    CANCELLED
};

std::string downloadStateToString(DownloadState state);

/**
 * Observations for one fetch
 */
struct PartitionReport {
    size_t index = 0;               ///< 0-based fetch number within the region
    size_t exclusion_size = 0;      ///< Known identifiers when the fetch started
    bool remote_exclusion = false;  ///< Exclusion sent as an uploaded table
    size_t rows = 0;                ///< Rows returned
    size_t inserted = 0;            ///< Rows newly stored
    size_t duplicates = 0;          ///< Rows already stored
};

/**
 * Outcome of one region run
 */
struct RegionSyncResult {
    std::string region;
    DownloadState state = DownloadState::IDLE;
    std::optional<int64_t> serial;
    std::vector<PartitionReport> partitions;
    size_t downloaded = 0;
    size_t inserted = 0;
    size_t duplicates = 0;
    std::string error;              ///< Cause, FAILED only
};

/**
 * Download settings shared by every region of a batch
 */
struct DownloadOptions {
    double extra_size = 1.5;
    std::optional<size_t> partition_size = 500000;   ///< nullopt = unbounded, single fetch
    bool remove_jobs = true;                          ///< Remove finished jobs when authenticated
};

/**
 * PartitionedDownloader - Pages through the records of one region
 *
 * Each fetch asks for at most partition_size rows that are not in the
 * exclusion set yet. Because results are ordered by identifier and every
 * stored identifier is excluded, consecutive fetches never overlap. A fetch
 * returning fewer rows than the partition size ends the region; so does an
 * empty fetch.
 *
 * The region is saved before its first non-empty batch. Records already
 * persisted by earlier partitions stay stored when a later fetch fails.
 *
 * Errors from the query builder, remote service or store are rethrown as
 * SyncException after the state moves to FAILED; result() still describes
 * the partitions completed before the failure.
 */
class PartitionedDownloader {
public:
    PartitionedDownloader(const SpatialQueryBuilder& builder,
                          RegionStore& store,
                          SessionManager& session,
                          Logger& logger,
                          DownloadOptions options);

    PartitionedDownloader(const PartitionedDownloader&) = delete;
    PartitionedDownloader& operator=(const PartitionedDownloader&) = delete;

    /**
     * Download every missing record of the region
     *
     * @param region Region to synchronize, stamped with its serial when saved
     * @param exclusion Initialized exclusion set for the region
     * @param cancelled Checked before each fetch (optional)
     * @return Terminal result (DONE, EMPTY or CANCELLED)
     * @throws SyncException when a fetch or save fails
     */
    const RegionSyncResult& synchronize(Region& region,
                                        ExclusionSetManager& exclusion,
                                        const std::atomic<bool>* cancelled = nullptr);

    DownloadState state() const { return state_; }

    const RegionSyncResult& result() const { return result_; }

private:
    const SpatialQueryBuilder& builder_;
    RegionStore& store_;
    SessionManager& session_;
    Logger& logger_;
    DownloadOptions options_;

    DownloadState state_ = DownloadState::IDLE;
    RegionSyncResult result_;

    void finish(DownloadState state);
};

} // namespace gaiasync
} // namespace ocl
