#pragma once

#include "types.h"
#include "schema_descriptor.h"
#include <optional>
#include <string>
#include <vector>

namespace ocl {
namespace gaiasync {

class Logger;

/**
 * How already-known identifiers are removed from a remote query
 */
struct ExclusionFilter {
    enum class Kind {
        NONE,           ///< Nothing to exclude
        INLINE_IDS,     ///< "source_id NOT IN (...)" predicate
        REMOTE_TABLE    ///< Anti-join against an uploaded table
    };

    Kind kind = Kind::NONE;
    std::vector<SourceId> ids;   ///< Ascending, INLINE_IDS only
    std::string table;           ///< Qualified table name, REMOTE_TABLE only

    static ExclusionFilter none() { return ExclusionFilter(); }
    static ExclusionFilter inlineIds(std::vector<SourceId> ids);
    static ExclusionFilter remoteTable(std::string qualified_name);
};

/**
 * SpatialQueryBuilder - Generate ADQL queries for region downloads
 *
 * The generated query selects every schema column of the records whose
 * position lies inside the (optionally enlarged) region, minus the
 * excluded identifiers, ordered by identifier ascending. The ordering makes
 * TOP-n partitions well defined.
 *
 * Example output for a circular region with a remote exclusion table:
 * @code
 *   SELECT TOP 500000 A.solution_id, A.designation, A.source_id, ...
 *   FROM gaiadr2.gaia_source A
 *   LEFT JOIN user_jdoe.ocl_1a2b3c4d5e6f7a8b B ON A.source_id = B.source_id
 *   WHERE B.source_id IS NULL
 *   AND 1 = CONTAINS(POINT('ICRS', A.ra, A.dec), CIRCLE('ICRS', 56.75, 24.1167, 1.5))
 *   ORDER BY A.source_id ASC
 * @endcode
 */
class SpatialQueryBuilder {
public:
    /**
     * @param schema Columns to select and remote table to query
     * @param logger Receives the negative extra size warning
     */
    SpatialQueryBuilder(const SchemaDescriptor& schema, Logger& logger);

    /**
     * Compose the download query for a region
     *
     * @param region Region to download
     * @param extra_size Size multiplier, negative values use their absolute value
     * @param partition_size Maximum rows (TOP n), nullopt for unbounded
     * @param exclusion Identifiers to leave out
     * @return ADQL query string
     * @throws SyncException (INVALID_PARAMS) for a zero partition size or an
     *         unsafe remote table name
     */
    std::string buildRegionQuery(const Region& region,
                                 double extra_size,
                                 std::optional<size_t> partition_size,
                                 const ExclusionFilter& exclusion) const;

    /**
     * Coerce a negative multiplier to its absolute value, logging a warning
     */
    static double normalizeExtraSize(double extra_size, Logger& logger);

    const SchemaDescriptor& schema() const { return schema_; }

private:
    const SchemaDescriptor& schema_;
    Logger& logger_;

    std::string buildContainsPredicate(const Region& region, double extra_size) const;
};

} // namespace gaiasync
} // namespace ocl
