#pragma once

#include "types.h"
#include <istream>
#include <map>
#include <string>

namespace ocl {
namespace gaiasync {

class Logger;

/**
 * @brief Loader for the OpenClust open cluster catalogue (clusters.dat)
 *
 * Fixed-width text, one cluster per line:
 * - columns 0-16: cluster name
 * - columns 18-25: right ascension "HH MM SS" (J2000)
 * - columns 27-35: declination "+DD MM SS"
 * - columns 37-38: G1 classification flag (optional)
 * - columns 40-46: apparent diameter [arcmin]
 *
 * Every cluster becomes a circular Region; the G1 flag is kept in the
 * "g1_class" property.
 *
 * https://heasarc.gsfc.nasa.gov/W3Browse/star-catalog/openclust.html
 */
class OpenClustCatalogue {
public:
    /**
     * @brief Load the whole catalogue
     * @param path Path to clusters.dat
     * @param logger Receives one warning per rejected line
     * @return Regions by cluster name
     * @throws SyncException (INVALID_PARAMS) if the file cannot be opened
     */
    static std::map<std::string, Region> load(const std::string& path, Logger& logger);

    /**
     * @brief Parse catalogue lines from a stream, skipping invalid ones
     */
    static std::map<std::string, Region> parse(std::istream& input, Logger& logger);

    /**
     * @brief Parse a single catalogue line
     * @throws SyncException (PARSE_ERROR) for missing or malformed fields
     */
    static Region parseEntry(const std::string& line);
};

} // namespace gaiasync
} // namespace ocl
