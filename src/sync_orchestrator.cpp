#include "ocl_gaiasync/sync_orchestrator.h"
#include "ocl_gaiasync/exclusion_set.h"
#include "ocl_gaiasync/logger.h"
#include "ocl_gaiasync/query_builder.h"
#include "ocl_gaiasync/region_store.h"
#include "ocl_gaiasync/session_manager.h"
#include <algorithm>
#include <thread>

namespace ocl {
namespace gaiasync {

// =============================================================================
// BatchSummary
// =============================================================================

namespace {

template <typename Pred>
size_t countIf(const std::vector<RegionSyncResult>& regions, Pred pred) {
    return static_cast<size_t>(std::count_if(regions.begin(), regions.end(), pred));
}

} // namespace

size_t BatchSummary::completed() const {
    return countIf(regions, [](const RegionSyncResult& r) {
        return r.state == DownloadState::DONE || r.state == DownloadState::EMPTY;
    });
}

size_t BatchSummary::failed() const {
    return countIf(regions, [](const RegionSyncResult& r) {
        return r.state == DownloadState::FAILED;
    });
}

size_t BatchSummary::cancelled() const {
    return countIf(regions, [](const RegionSyncResult& r) {
        return r.state == DownloadState::CANCELLED;
    });
}

size_t BatchSummary::downloaded() const {
    size_t total = 0;
    for (const auto& r : regions) total += r.downloaded;
    return total;
}

size_t BatchSummary::inserted() const {
    size_t total = 0;
    for (const auto& r : regions) total += r.inserted;
    return total;
}

size_t BatchSummary::duplicates() const {
    size_t total = 0;
    for (const auto& r : regions) total += r.duplicates;
    return total;
}

// =============================================================================
// SyncOrchestrator
// =============================================================================

SyncOrchestrator::SyncOrchestrator(const SpatialQueryBuilder& builder,
                                   RegionStore& store,
                                   SessionManager& session,
                                   Logger& logger,
                                   SyncOptions options)
    : builder_(builder), store_(store), session_(session), logger_(logger),
      options_(std::move(options)) {
    if (options_.download.partition_size && *options_.download.partition_size == 0) {
        throw SyncException(ErrorCode::INVALID_PARAMS, "partition_size must be positive");
    }
    if (options_.workers == 0) {
        options_.workers = 1;
    }
    options_.download.extra_size =
        SpatialQueryBuilder::normalizeExtraSize(options_.download.extra_size, logger_);
}

BatchSummary SyncOrchestrator::run(std::vector<Region> regions) {
    std::stable_sort(regions.begin(), regions.end());
    regions.erase(std::unique(regions.begin(), regions.end()), regions.end());

    BatchSummary summary;
    summary.regions.resize(regions.size());

    logger_.info("Synchronizing " + std::to_string(regions.size()) + " regions");

    ScopedSession session_scope(session_);

    const size_t num_workers = std::min<size_t>(options_.workers, regions.size());

    if (num_workers <= 1) {
        for (size_t i = 0; i < regions.size(); ++i) {
            summary.regions[i] = syncRegion(regions[i]);
        }
    } else {
        std::atomic<size_t> next{0};
        std::vector<std::thread> pool;
        pool.reserve(num_workers);

        for (size_t w = 0; w < num_workers; ++w) {
            pool.emplace_back([&]() {
                for (size_t i = next.fetch_add(1); i < regions.size(); i = next.fetch_add(1)) {
                    summary.regions[i] = syncRegion(regions[i]);
                }
            });
        }

        for (auto& t : pool) {
            t.join();
        }
    }

    logSummary(summary);
    return summary;
}

RegionSyncResult SyncOrchestrator::syncRegion(Region& region) {
    RegionSyncResult last;
    last.region = region.name();

    for (unsigned attempt = 0; attempt <= options_.region_retries; ++attempt) {
        if (cancelled_.load()) {
            last.state = DownloadState::CANCELLED;
            return last;
        }

        if (attempt > 0) {
            logger_.info(region.name() + ": retry " + std::to_string(attempt) + " of " +
                         std::to_string(options_.region_retries));
        }

        ExclusionSetManager exclusion(region, logger_, options_.inline_warn_threshold);
        PartitionedDownloader downloader(builder_, store_, session_, logger_, options_.download);

        try {
            exclusion.initialize(store_);
            return downloader.synchronize(region, exclusion, &cancelled_);
        } catch (const SyncException& e) {
            last = downloader.result();
            last.region = region.name();
            last.state = DownloadState::FAILED;
            last.error = errorCodeToString(e.code()) + ": " + e.what();
        } catch (const std::exception& e) {
            last = downloader.result();
            last.region = region.name();
            last.state = DownloadState::FAILED;
            last.error = std::string("Unexpected error: ") + e.what();
        }

        logger_.error(region.name() + ": synchronization failed: " + last.error);

        if (attempt < options_.region_retries) {
            backoff(attempt);
        }
    }

    return last;
}

void SyncOrchestrator::backoff(unsigned attempt) {
    auto delay = options_.retry_backoff * (1LL << std::min(attempt, 10u));
    auto deadline = std::chrono::steady_clock::now() + delay;
    const auto step = std::chrono::milliseconds(50);

    while (!cancelled_.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(step);
    }
}

void SyncOrchestrator::logSummary(const BatchSummary& summary) {
    for (const auto& r : summary.regions) {
        if (r.state == DownloadState::FAILED) {
            logger_.warn(r.region + ": Failed (" + r.error + ")");
        } else {
            logger_.info(r.region + ": " + downloadStateToString(r.state) + ", " +
                         std::to_string(r.downloaded) + " downloaded, " +
                         std::to_string(r.inserted) + " inserted, " +
                         std::to_string(r.duplicates) + " duplicates skipped");
        }
    }

    logger_.info("Batch finished: " + std::to_string(summary.completed()) + " completed, " +
                 std::to_string(summary.failed()) + " failed, " +
                 std::to_string(summary.cancelled()) + " cancelled, " +
                 std::to_string(summary.inserted()) + " records inserted");
}

} // namespace gaiasync
} // namespace ocl
