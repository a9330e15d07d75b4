#pragma once

#include <cstdint>
#include <exception>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ocl {
namespace gaiasync {

/**
 * Gaia source identifier (the record identifier within a region)
 */
using SourceId = int64_t;

/**
 * Equatorial coordinates (ICRS)
 */
struct EquatorialCoordinates {
    double ra;                   ///< Right Ascension [degrees]
    double dec;                  ///< Declination [degrees]

    EquatorialCoordinates() : ra(0.0), dec(0.0) {}
    EquatorialCoordinates(double ra_, double dec_) : ra(ra_), dec(dec_) {}
};

/**
 * Circular region shape
 */
struct Circular {
    double diam;                 ///< Apparent diameter [arcmin]
};

/**
 * Rectangular region shape
 */
struct Rectangular {
    double width;                ///< Apparent width [arcmin]
    double height;               ///< Apparent height [arcmin]
};

/**
 * Region shape descriptor. Exactly one alternative is ever present.
 */
using Shape = std::variant<Circular, Rectangular>;

/**
 * Type-specific region properties (e.g. open cluster classification flags).
 * Stored opaquely by the persistence layer.
 */
using RegionProperties = std::map<std::string, std::string>;

/**
 * Named sky area whose contained records are synchronized as a unit.
 *
 * The serial is assigned by the persistence layer on first save and never
 * changes afterwards.
 */
class Region {
public:
    /**
     * @param name Unique region name
     * @param coords Region center
     * @param shape Circular or rectangular extent
     * @param properties Optional opaque properties
     * @throws SyncException (INVALID_PARAMS) for empty names, out of range
     *         coordinates or non-positive sizes
     */
    Region(std::string name, EquatorialCoordinates coords, Shape shape,
           RegionProperties properties = {});

    const std::string& name() const { return name_; }
    const EquatorialCoordinates& coords() const { return coords_; }
    const Shape& shape() const { return shape_; }
    const RegionProperties& properties() const { return properties_; }

    bool isCircular() const { return std::holds_alternative<Circular>(shape_); }

    std::optional<int64_t> serial() const { return serial_; }

    /**
     * Stamp the persistence serial.
     * @throws SyncException (STORAGE_ERROR) if a different serial was already assigned
     */
    void assignSerial(int64_t serial);

    /**
     * True when both regions describe the same sky area (coordinates and shape)
     */
    bool sameGeometry(const Region& other) const;

    bool operator==(const Region& other) const { return name_ == other.name_; }
    bool operator<(const Region& other) const { return name_ < other.name_; }

private:
    std::string name_;
    EquatorialCoordinates coords_;
    Shape shape_;
    RegionProperties properties_;
    std::optional<int64_t> serial_;
};

/**
 * One catalog row. Values are aligned with the schema descriptor columns;
 * an empty optional is a NULL.
 */
struct CatalogRecord {
    SourceId source_id = 0;
    std::vector<std::optional<std::string>> values;
};

/**
 * A page of catalog rows as returned by one remote query
 */
struct RecordBatch {
    std::vector<CatalogRecord> records;

    size_t size() const { return records.size(); }
    bool empty() const { return records.empty(); }

    std::vector<SourceId> sourceIds() const;
};

/**
 * Remote service credentials
 */
struct Credentials {
    std::string username;
    std::string password;
};

/**
 * Error types for exception handling
 */
enum class ErrorCode {
    SUCCESS = 0,
    NETWORK_ERROR,          ///< Transport failure, retryable by rerunning the region
    TIMEOUT,                ///< Transport timeout, treated like NETWORK_ERROR
    REMOTE_SERVICE_ERROR,   ///< Query rejected, malformed or quota exceeded
    PARSE_ERROR,            ///< Unreadable remote response
    STORAGE_ERROR,          ///< Store unreachable or integrity violation
    SESSION_ERROR,          ///< Login failure
    ARTIFACT_CLEANUP_ERROR, ///< Remote temporary table could not be removed
    INVALID_PARAMS,
    CANCELLED
};

/**
 * Exception class for synchronization errors
 */
class SyncException : public std::exception {
public:
    SyncException(ErrorCode code, const std::string& message)
        : code_(code), message_(message) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
    std::string message_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * Convert ErrorCode to a readable name (e.g. "REMOTE_SERVICE_ERROR")
 */
std::string errorCodeToString(ErrorCode code);

/**
 * Network and timeout errors may succeed when the region is retried
 */
bool isTransient(ErrorCode code);

/**
 * Validate coordinate ranges
 */
bool isValidCoordinate(const EquatorialCoordinates& coord);

/**
 * Convert arc-minutes to degrees
 */
inline double arcminToDegrees(double arcmin) { return arcmin / 60.0; }

} // namespace gaiasync
} // namespace ocl
