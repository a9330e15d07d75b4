#include "ocl_gaiasync/types.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <type_traits>

namespace ocl {
namespace gaiasync {

// =============================================================================
// Region Implementation
// =============================================================================

namespace {

constexpr double kGeometryTolerance = 1e-9;

bool nearlyEqual(double a, double b) {
    return std::fabs(a - b) <= kGeometryTolerance * std::max(1.0, std::fabs(a));
}

} // anonymous namespace

Region::Region(std::string name, EquatorialCoordinates coords, Shape shape,
               RegionProperties properties)
    : name_(std::move(name)),
      coords_(coords),
      shape_(shape),
      properties_(std::move(properties)) {

    if (name_.empty()) {
        throw SyncException(ErrorCode::INVALID_PARAMS, "Region name cannot be empty");
    }

    if (!isValidCoordinate(coords_)) {
        std::ostringstream ss;
        ss << "Region '" << name_ << "' has invalid coordinates: RA=" << coords_.ra
           << ", Dec=" << coords_.dec;
        throw SyncException(ErrorCode::INVALID_PARAMS, ss.str());
    }

    bool valid_size = std::visit([](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Circular>) {
            return s.diam > 0.0;
        } else {
            return s.width > 0.0 && s.height > 0.0;
        }
    }, shape_);

    if (!valid_size) {
        throw SyncException(ErrorCode::INVALID_PARAMS,
                            "Region '" + name_ + "' must have a positive size");
    }
}

void Region::assignSerial(int64_t serial) {
    if (serial_.has_value() && *serial_ != serial) {
        throw SyncException(ErrorCode::STORAGE_ERROR,
                            "Region '" + name_ + "' already has serial " +
                            std::to_string(*serial_) + ", refusing " +
                            std::to_string(serial));
    }
    serial_ = serial;
}

bool Region::sameGeometry(const Region& other) const {
    if (!nearlyEqual(coords_.ra, other.coords_.ra) ||
        !nearlyEqual(coords_.dec, other.coords_.dec)) {
        return false;
    }

    if (shape_.index() != other.shape_.index()) {
        return false;
    }

    if (const auto* c = std::get_if<Circular>(&shape_)) {
        return nearlyEqual(c->diam, std::get<Circular>(other.shape_).diam);
    }

    const auto& r = std::get<Rectangular>(shape_);
    const auto& o = std::get<Rectangular>(other.shape_);
    return nearlyEqual(r.width, o.width) && nearlyEqual(r.height, o.height);
}

// =============================================================================
// RecordBatch Implementation
// =============================================================================

std::vector<SourceId> RecordBatch::sourceIds() const {
    std::vector<SourceId> ids;
    ids.reserve(records.size());
    for (const auto& record : records) {
        ids.push_back(record.source_id);
    }
    return ids;
}

// =============================================================================
// Utility Functions
// =============================================================================

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:                return "SUCCESS";
        case ErrorCode::NETWORK_ERROR:          return "NETWORK_ERROR";
        case ErrorCode::TIMEOUT:                return "TIMEOUT";
        case ErrorCode::REMOTE_SERVICE_ERROR:   return "REMOTE_SERVICE_ERROR";
        case ErrorCode::PARSE_ERROR:            return "PARSE_ERROR";
        case ErrorCode::STORAGE_ERROR:          return "STORAGE_ERROR";
        case ErrorCode::SESSION_ERROR:          return "SESSION_ERROR";
        case ErrorCode::ARTIFACT_CLEANUP_ERROR: return "ARTIFACT_CLEANUP_ERROR";
        case ErrorCode::INVALID_PARAMS:         return "INVALID_PARAMS";
        case ErrorCode::CANCELLED:              return "CANCELLED";
    }
    return "UNKNOWN";
}

bool isTransient(ErrorCode code) {
    return code == ErrorCode::NETWORK_ERROR || code == ErrorCode::TIMEOUT;
}

bool isValidCoordinate(const EquatorialCoordinates& coord) {
    // RA range [0, 360)
    if (coord.ra < 0.0 || coord.ra >= 360.0) return false;

    // Dec range [-90, 90]
    if (coord.dec < -90.0 || coord.dec > 90.0) return false;

    return true;
}

} // namespace gaiasync
} // namespace ocl
