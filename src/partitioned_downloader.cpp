#include "ocl_gaiasync/partitioned_downloader.h"
#include "ocl_gaiasync/exclusion_set.h"
#include "ocl_gaiasync/logger.h"
#include "ocl_gaiasync/query_builder.h"
#include "ocl_gaiasync/region_store.h"
#include "ocl_gaiasync/remote_catalog_service.h"
#include "ocl_gaiasync/session_manager.h"

namespace ocl {
namespace gaiasync {

std::string downloadStateToString(DownloadState state) {
    switch (state) {
        case DownloadState::IDLE: return "Idle";
        case DownloadState::FETCHING: return "Fetching";
        case DownloadState::SAVED: return "Saved";
        case DownloadState::EMPTY: return "Empty";
        case DownloadState::FAILED: return "Failed";
        case DownloadState::DONE: return "Done";
        case DownloadState::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

PartitionedDownloader::PartitionedDownloader(const SpatialQueryBuilder& builder,
                                             RegionStore& store,
                                             SessionManager& session,
                                             Logger& logger,
                                             DownloadOptions options)
    : builder_(builder), store_(store), session_(session), logger_(logger),
      options_(std::move(options)) {
    if (options_.partition_size && *options_.partition_size == 0) {
        throw SyncException(ErrorCode::INVALID_PARAMS, "partition_size must be positive");
    }
    options_.extra_size = SpatialQueryBuilder::normalizeExtraSize(options_.extra_size, logger_);
}

void PartitionedDownloader::finish(DownloadState state) {
    state_ = state;
    result_.state = state;
}

const RegionSyncResult& PartitionedDownloader::synchronize(Region& region,
                                                           ExclusionSetManager& exclusion,
                                                           const std::atomic<bool>* cancelled) {
    result_ = RegionSyncResult();
    result_.region = region.name();
    state_ = DownloadState::IDLE;

    RemoteCatalogService& service = session_.service();
    bool region_saved = false;

    try {
        for (size_t index = 0;; ++index) {
            if (cancelled && cancelled->load()) {
                logger_.info(region.name() + ": cancelled before partition " +
                             std::to_string(index + 1));
                finish(DownloadState::CANCELLED);
                return result_;
            }

            state_ = DownloadState::FETCHING;

            PartitionReport report;
            report.index = index;
            report.exclusion_size = exclusion.size();

            const bool authenticated = session_.isAuthenticated();
            QueryResult fetched;
            {
                // The lease deletes its remote table before the next fetch,
                // also when the query throws
                ExclusionLease lease = exclusion.prepare(service, authenticated,
                                                         &session_.artifactMutex());
                report.remote_exclusion = lease.ownsRemoteTable();

                std::string adql = builder_.buildRegionQuery(region, options_.extra_size,
                                                             options_.partition_size,
                                                             lease.filter());
                logger_.debug(region.name() + ": partition " + std::to_string(index + 1) +
                              " query: " + adql);

                fetched = service.executeQuery(adql);
                lease.release();
            }

            if (options_.remove_jobs && authenticated && !fetched.job_id.empty()) {
                try {
                    service.removeJob(fetched.job_id);
                } catch (const SyncException& e) {
                    logger_.warn(region.name() + ": could not remove job " + fetched.job_id +
                                 ": " + e.what());
                }
            }

            const RecordBatch& batch = fetched.batch;
            report.rows = batch.size();

            if (batch.empty()) {
                if (report.exclusion_size == 0) {
                    logger_.warn(region.name() + ": no data found");
                } else {
                    logger_.info(region.name() + ": no new data");
                }
                result_.partitions.push_back(report);
                finish(result_.downloaded > 0 ? DownloadState::DONE : DownloadState::EMPTY);
                return result_;
            }

            if (!region_saved) {
                result_.serial = store_.saveRegion(region);
                region_saved = true;
            }

            SaveStats stats = store_.saveRecords(*result_.serial, batch);
            exclusion.absorb(batch.sourceIds());
            state_ = DownloadState::SAVED;

            report.inserted = stats.inserted;
            report.duplicates = stats.duplicates;
            result_.partitions.push_back(report);
            result_.downloaded += report.rows;
            result_.inserted += stats.inserted;
            result_.duplicates += stats.duplicates;

            logger_.info(region.name() + ": partition " + std::to_string(index + 1) + ": " +
                         std::to_string(report.rows) + " rows (" +
                         std::to_string(stats.inserted) + " new, " +
                         std::to_string(stats.duplicates) + " duplicates)");

            if (!options_.partition_size || report.rows < *options_.partition_size) {
                finish(DownloadState::DONE);
                return result_;
            }

            state_ = DownloadState::IDLE;
        }
    } catch (const SyncException& e) {
        finish(DownloadState::FAILED);
        result_.error = errorCodeToString(e.code()) + ": " + e.what();
        throw;
    }
}

} // namespace gaiasync
} // namespace ocl
