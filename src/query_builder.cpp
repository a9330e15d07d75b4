#include "ocl_gaiasync/query_builder.h"
#include "ocl_gaiasync/logger.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace ocl {
namespace gaiasync {

// =============================================================================
// ExclusionFilter
// =============================================================================

ExclusionFilter ExclusionFilter::inlineIds(std::vector<SourceId> ids) {
    ExclusionFilter filter;
    filter.kind = Kind::INLINE_IDS;
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    filter.ids = std::move(ids);
    return filter;
}

ExclusionFilter ExclusionFilter::remoteTable(std::string qualified_name) {
    ExclusionFilter filter;
    filter.kind = Kind::REMOTE_TABLE;
    filter.table = std::move(qualified_name);
    return filter;
}

// =============================================================================
// SpatialQueryBuilder
// =============================================================================

SpatialQueryBuilder::SpatialQueryBuilder(const SchemaDescriptor& schema, Logger& logger)
    : schema_(schema), logger_(logger) {}

double SpatialQueryBuilder::normalizeExtraSize(double extra_size, Logger& logger) {
    if (extra_size < 0.0) {
        extra_size = std::fabs(extra_size);
        std::ostringstream msg;
        msg << "extra_size parameter must be positive. Absolute value will be taken: " << extra_size;
        logger.warn(msg.str());
    }
    return extra_size;
}

std::string SpatialQueryBuilder::buildRegionQuery(const Region& region,
                                                  double extra_size,
                                                  std::optional<size_t> partition_size,
                                                  const ExclusionFilter& exclusion) const {
    if (partition_size.has_value() && *partition_size == 0) {
        throw SyncException(ErrorCode::INVALID_PARAMS, "Partition size must be at least 1");
    }

    extra_size = normalizeExtraSize(extra_size, logger_);

    const std::string& id = schema_.idColumn();

    std::ostringstream adql;
    adql << "SELECT ";
    if (partition_size.has_value()) {
        adql << "TOP " << *partition_size << " ";
    }

    const auto& columns = schema_.columns();
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) adql << ", ";
        adql << "A." << columns[i].name;
    }
    adql << " FROM " << schema_.remoteTable() << " A ";

    switch (exclusion.kind) {
        case ExclusionFilter::Kind::NONE:
            adql << "WHERE ";
            break;

        case ExclusionFilter::Kind::INLINE_IDS:
            adql << "WHERE ";
            if (!exclusion.ids.empty()) {
                adql << "A." << id << " NOT IN (";
                for (size_t i = 0; i < exclusion.ids.size(); ++i) {
                    if (i > 0) adql << ", ";
                    adql << exclusion.ids[i];
                }
                adql << ") AND ";
            }
            break;

        case ExclusionFilter::Kind::REMOTE_TABLE:
            if (!SchemaDescriptor::isSafeIdentifier(exclusion.table)) {
                throw SyncException(ErrorCode::INVALID_PARAMS,
                                    "Unsafe exclusion table name: " + exclusion.table);
            }
            adql << "LEFT JOIN " << exclusion.table << " B "
                 << "ON A." << id << " = B." << id << " "
                 << "WHERE B." << id << " IS NULL AND ";
            break;
    }

    adql << buildContainsPredicate(region, extra_size);
    adql << " ORDER BY A." << id << " ASC";

    return adql.str();
}

std::string SpatialQueryBuilder::buildContainsPredicate(const Region& region, double extra_size) const {
    const auto& coords = region.coords();

    std::ostringstream predicate;
    predicate << std::setprecision(12);
    predicate << "1 = CONTAINS(POINT('ICRS', A.ra, A.dec), ";

    std::visit([&](const auto& shape) {
        using T = std::decay_t<decltype(shape)>;
        if constexpr (std::is_same_v<T, Circular>) {
            double radius = arcminToDegrees(shape.diam) * extra_size / 2.0;
            predicate << "CIRCLE('ICRS', " << coords.ra << ", " << coords.dec << ", "
                      << radius << ")";
        } else {
            static_assert(std::is_same_v<T, Rectangular>, "unhandled region shape");
            double width = arcminToDegrees(shape.width) * extra_size;
            double height = arcminToDegrees(shape.height) * extra_size;
            predicate << "BOX('ICRS', " << coords.ra << ", " << coords.dec << ", "
                      << width << ", " << height << ")";
        }
    }, region.shape());

    predicate << ")";
    return predicate.str();
}

} // namespace gaiasync
} // namespace ocl
