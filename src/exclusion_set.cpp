#include "ocl_gaiasync/exclusion_set.h"
#include "ocl_gaiasync/logger.h"
#include "ocl_gaiasync/region_store.h"
#include "ocl_gaiasync/remote_catalog_service.h"
#include "ocl_gaiasync/schema_descriptor.h"
#include <zlib.h>
#include <algorithm>
#include <cstdio>

namespace ocl {
namespace gaiasync {

// =============================================================================
// ExclusionLease
// =============================================================================

ExclusionLease::~ExclusionLease() {
    release();
}

ExclusionLease::ExclusionLease(ExclusionLease&& other) noexcept
    : filter_(std::move(other.filter_)),
      service_(other.service_),
      logger_(other.logger_),
      table_name_(std::move(other.table_name_)),
      artifact_lock_(std::move(other.artifact_lock_)) {
    other.service_ = nullptr;
}

ExclusionLease& ExclusionLease::operator=(ExclusionLease&& other) noexcept {
    if (this != &other) {
        release();
        filter_ = std::move(other.filter_);
        service_ = other.service_;
        logger_ = other.logger_;
        table_name_ = std::move(other.table_name_);
        artifact_lock_ = std::move(other.artifact_lock_);
        other.service_ = nullptr;
    }
    return *this;
}

void ExclusionLease::release() {
    if (service_ == nullptr) {
        return;
    }

    RemoteCatalogService* service = service_;
    service_ = nullptr;

    try {
        service->deleteTable(table_name_);
        if (logger_) {
            logger_->debug("Deleted exclusion table " + table_name_);
        }
    } catch (const std::exception& e) {
        if (logger_) {
            logger_->error(errorCodeToString(ErrorCode::ARTIFACT_CLEANUP_ERROR) +
                           ": could not delete remote table " + table_name_ + ": " + e.what());
        }
    }

    if (artifact_lock_.owns_lock()) {
        artifact_lock_.unlock();
    }
}

// =============================================================================
// ExclusionSetManager
// =============================================================================

ExclusionSetManager::ExclusionSetManager(const Region& region, Logger& logger,
                                         size_t inline_warn_threshold)
    : region_(region),
      artifact_name_(artifactNameFor(region.name())),
      logger_(logger),
      inline_warn_threshold_(inline_warn_threshold) {
}

void ExclusionSetManager::initialize(RegionStore& store) {
    ids_ = store.getKnownRecordIds(region_);
    logger_.debug(region_.name() + ": " + std::to_string(ids_.size()) +
                  " records already stored");
}

size_t ExclusionSetManager::absorb(const std::vector<SourceId>& ids) {
    size_t added = 0;
    for (SourceId id : ids) {
        if (ids_.insert(id).second) {
            ++added;
        }
    }
    return added;
}

std::vector<SourceId> ExclusionSetManager::sortedIds() const {
    std::vector<SourceId> sorted(ids_.begin(), ids_.end());
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

ExclusionLease ExclusionSetManager::prepare(RemoteCatalogService& service, bool authenticated,
                                            std::mutex* artifact_mutex) {
    ExclusionLease lease;
    if (ids_.empty()) {
        return lease;
    }

    std::vector<SourceId> ids = sortedIds();

    if (authenticated) {
        std::unique_lock<std::mutex> lock;
        if (artifact_mutex) {
            lock = std::unique_lock<std::mutex>(*artifact_mutex);
        }

        try {
            std::string qualified = service.uploadTable(artifact_name_, ids);
            lease.service_ = &service;
            lease.logger_ = &logger_;
            lease.table_name_ = artifact_name_;
            lease.artifact_lock_ = std::move(lock);

            // The user schema comes from the login name and may not be a valid ADQL identifier
            if (SchemaDescriptor::isSafeIdentifier(qualified)) {
                lease.filter_ = ExclusionFilter::remoteTable(qualified);
                logger_.debug(region_.name() + ": uploaded " + std::to_string(ids.size()) +
                              " known identifiers to " + qualified);
                return lease;
            }

            logger_.warn(region_.name() + ": exclusion table " + qualified +
                         " cannot be referenced in a query, using inline identifier list");
            lease.release();
        } catch (const SyncException& e) {
            logger_.warn(region_.name() + ": exclusion table upload failed (" +
                         std::string(e.what()) + "), using inline identifier list");
        }
    }

    if (ids.size() > inline_warn_threshold_) {
        logger_.warn(region_.name() + ": inline exclusion list has " +
                     std::to_string(ids.size()) +
                     " identifiers, queries may be rejected by the remote service");
    }

    lease.filter_ = ExclusionFilter::inlineIds(std::move(ids));
    return lease;
}

std::string ExclusionSetManager::artifactNameFor(const std::string& region_name) {
    const Bytef* data = reinterpret_cast<const Bytef*>(region_name.data());
    uInt length = static_cast<uInt>(region_name.size());

    uLong crc = crc32(crc32(0L, Z_NULL, 0), data, length);
    uLong adler = adler32(adler32(0L, Z_NULL, 0), data, length);

    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%08lx%08lx",
                  static_cast<unsigned long>(crc & 0xffffffffUL),
                  static_cast<unsigned long>(adler & 0xffffffffUL));
    return std::string("ocl_") + buffer;
}

} // namespace gaiasync
} // namespace ocl
