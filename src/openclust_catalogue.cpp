#include "ocl_gaiasync/openclust_catalogue.h"
#include "ocl_gaiasync/logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace ocl {
namespace gaiasync {

namespace {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

// Substring that tolerates short lines
std::string field(const std::string& line, size_t begin, size_t end) {
    if (begin >= line.size()) return "";
    return line.substr(begin, std::min(end, line.size()) - begin);
}

int parseDigits(const std::string& text, const std::string& what, const std::string& name) {
    std::string value = trim(text);
    if (value.empty()) {
        throw SyncException(ErrorCode::PARSE_ERROR,
                            "Cluster " + name + " does not have a valid " + what);
    }
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw SyncException(ErrorCode::PARSE_ERROR,
                                "Cluster " + name + " does not have a valid " + what +
                                ": '" + text + "'");
        }
    }
    return std::stoi(value);
}

} // namespace

Region OpenClustCatalogue::parseEntry(const std::string& line) {
    std::string name = trim(field(line, 0, 17));
    if (name.empty()) {
        throw SyncException(ErrorCode::PARSE_ERROR, "Catalogue entry without cluster name");
    }

    // Right ascension (hours)
    int ra_h = parseDigits(field(line, 18, 20), "right ascension", name);
    int ra_m = parseDigits(field(line, 21, 23), "right ascension", name);
    int ra_s = parseDigits(field(line, 24, 26), "right ascension", name);
    double ra = (ra_h + ra_m / 60.0 + ra_s / 3600.0) * 15.0;

    // Declination (sign is part of the degrees field, "-00" included)
    std::string dec_deg_field = trim(field(line, 27, 30));
    double sign = 1.0;
    if (!dec_deg_field.empty() && (dec_deg_field[0] == '-' || dec_deg_field[0] == '+')) {
        sign = dec_deg_field[0] == '-' ? -1.0 : 1.0;
        dec_deg_field = dec_deg_field.substr(1);
    }
    int dec_d = parseDigits(dec_deg_field, "declination", name);
    int dec_m = parseDigits(field(line, 31, 33), "declination", name);
    int dec_s = parseDigits(field(line, 34, 36), "declination", name);
    double dec = sign * (dec_d + dec_m / 60.0 + dec_s / 3600.0);

    RegionProperties properties;
    std::string g1_class = trim(field(line, 37, 39));
    if (!g1_class.empty()) {
        properties["g1_class"] = g1_class;
    }

    std::string diam_field = trim(field(line, 40, 47));
    if (diam_field.empty()) {
        throw SyncException(ErrorCode::PARSE_ERROR,
                            "Cluster '" + name + "' does not have diameter info");
    }
    double diam = 0.0;
    try {
        size_t consumed = 0;
        diam = std::stod(diam_field, &consumed);
        if (consumed != diam_field.size()) {
            throw std::invalid_argument(diam_field);
        }
    } catch (const std::logic_error&) {
        throw SyncException(ErrorCode::PARSE_ERROR,
                            "Cluster '" + name + "' has an invalid diameter: '" + diam_field + "'");
    }

    try {
        return Region(name, EquatorialCoordinates(ra, dec), Circular{diam}, std::move(properties));
    } catch (const SyncException& e) {
        throw SyncException(ErrorCode::PARSE_ERROR, e.what());
    }
}

std::map<std::string, Region> OpenClustCatalogue::parse(std::istream& input, Logger& logger) {
    std::map<std::string, Region> clusters;
    std::string line;
    size_t line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        if (trim(line).empty()) {
            continue;
        }
        try {
            Region region = parseEntry(line);
            logger.debug("Loaded cluster: " + region.name());
            std::string name = region.name();
            clusters.insert_or_assign(name, std::move(region));
        } catch (const SyncException& e) {
            logger.warn("Line " + std::to_string(line_number) + ": " + e.what());
        }
    }

    return clusters;
}

std::map<std::string, Region> OpenClustCatalogue::load(const std::string& path, Logger& logger) {
    std::ifstream file(path);
    if (!file) {
        throw SyncException(ErrorCode::INVALID_PARAMS, "Cannot open catalogue file: " + path);
    }

    logger.info("Loading OpenClust catalogue " + path);
    auto clusters = parse(file, logger);
    logger.info("OpenClust catalogue loaded: " + std::to_string(clusters.size()) + " clusters");
    return clusters;
}

} // namespace gaiasync
} // namespace ocl
