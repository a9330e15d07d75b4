#pragma once

#include <map>
#include <string>

namespace ocl {
namespace gaiasync {

/**
 * Minimal reader/writer for flat JSON objects of scalar values.
 *
 * Used for configuration files and for the opaque region properties stored
 * in the database. Nested objects and arrays are not supported. Numbers,
 * booleans and null are returned as their literal text ("1.5", "true",
 * "null"); strings are unescaped.
 */
class SimpleJSON {
public:
    /**
     * @throws SyncException (PARSE_ERROR) on malformed input
     */
    static std::map<std::string, std::string> parse(const std::string& json_str);

    /**
     * Serialize as a JSON object with every value written as a string
     */
    static std::string serialize(const std::map<std::string, std::string>& values);

private:
    static std::string escape(const std::string& str);
};

} // namespace gaiasync
} // namespace ocl
