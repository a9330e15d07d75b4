#pragma once

#include "types.h"
#include <cstdint>
#include <unordered_set>

namespace ocl {
namespace gaiasync {

/**
 * Outcome of one saveRecords() call
 */
struct SaveStats {
    size_t inserted = 0;     ///< New rows committed
    size_t duplicates = 0;   ///< Rows skipped because (region, id) already existed
};

/**
 * RegionStore - Persistence contract used by the synchronization engine
 *
 * Both write operations are idempotent so that a region can be synchronized
 * again after any failure. Implementations report failures with
 * SyncException (STORAGE_ERROR).
 */
class RegionStore {
public:
    virtual ~RegionStore() = default;

    /**
     * Insert the region or update its properties if the name already exists.
     * Coordinates and shape of an existing region never change.
     *
     * Stamps the region with its serial.
     * @return Region serial
     */
    virtual int64_t saveRegion(Region& region) = 0;

    /**
     * Insert records for a region, silently skipping (region, id) pairs that
     * are already stored.
     */
    virtual SaveStats saveRecords(int64_t region_serial, const RecordBatch& batch) = 0;

    /**
     * Identifiers of every committed record of the region (empty if the
     * region was never saved)
     */
    virtual std::unordered_set<SourceId> getKnownRecordIds(const Region& region) = 0;
};

} // namespace gaiasync
} // namespace ocl
