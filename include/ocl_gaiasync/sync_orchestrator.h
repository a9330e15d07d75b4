#pragma once

#include "partitioned_downloader.h"
#include "types.h"
#include <atomic>
#include <chrono>
#include <vector>

namespace ocl {
namespace gaiasync {

class Logger;
class RegionStore;
class SessionManager;
class SpatialQueryBuilder;

/**
 * Batch settings
 */
struct SyncOptions {
    DownloadOptions download;
    unsigned workers = 1;                       ///< Regions synchronized concurrently
    unsigned region_retries = 0;                ///< Extra attempts after a failure
    std::chrono::milliseconds retry_backoff{1000};  ///< Doubled after every attempt
    size_t inline_warn_threshold = 10000;
};

/**
 * Per-region outcomes of a batch, sorted by region name
 */
struct BatchSummary {
    std::vector<RegionSyncResult> regions;

    size_t completed() const;       ///< DONE or EMPTY
    size_t failed() const;
    size_t cancelled() const;

    size_t downloaded() const;
    size_t inserted() const;
    size_t duplicates() const;

    bool allSucceeded() const { return completed() == regions.size(); }
};

/**
 * SyncOrchestrator - Synchronizes a set of regions
 *
 * Regions are processed in name order, each with a fresh exclusion set and
 * downloader. A failing region is logged with its cause and the batch moves
 * on; optional retries rerun the whole region, which is safe because
 * storage is idempotent.
 *
 * With workers > 1 the regions are pulled from a shared index by a fixed
 * pool of threads that share the session, the store and the remote client.
 *
 * The session is opened at the start of run() and closed when it returns,
 * including on cancellation.
 *
 * Example usage:
 * @code
 *   SyncOrchestrator orchestrator(builder, store, session, logger, SyncOptions());
 *   BatchSummary summary = orchestrator.run(regions);
 *   std::cout << summary.completed() << " regions synchronized\n";
 * @endcode
 */
class SyncOrchestrator {
public:
    /**
     * @throws SyncException (INVALID_PARAMS) for a zero partition size
     */
    SyncOrchestrator(const SpatialQueryBuilder& builder,
                     RegionStore& store,
                     SessionManager& session,
                     Logger& logger,
                     SyncOptions options);

    SyncOrchestrator(const SyncOrchestrator&) = delete;
    SyncOrchestrator& operator=(const SyncOrchestrator&) = delete;

    /**
     * Synchronize every region. Duplicated names are processed once.
     */
    BatchSummary run(std::vector<Region> regions);

    /**
     * Stop issuing partitions. Safe to call from a signal handler thread or
     * another worker; running regions stop before their next fetch.
     */
    void cancel() { cancelled_.store(true); }

    bool isCancelled() const { return cancelled_.load(); }

    const SyncOptions& options() const { return options_; }

private:
    const SpatialQueryBuilder& builder_;
    RegionStore& store_;
    SessionManager& session_;
    Logger& logger_;
    SyncOptions options_;
    std::atomic<bool> cancelled_{false};

    RegionSyncResult syncRegion(Region& region);
    void backoff(unsigned attempt);
    void logSummary(const BatchSummary& summary);
};

} // namespace gaiasync
} // namespace ocl
