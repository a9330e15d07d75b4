#pragma once

#include "types.h"
#include "schema_descriptor.h"
#include <string>
#include <vector>

namespace ocl {
namespace gaiasync {

/**
 * CSV parser for TAP results (FORMAT=csv)
 *
 * The first line is the header. Columns are matched to the schema by name, so
 * the service may return them in any order; schema columns missing from the
 * result are NULL and unknown result columns are ignored. Empty fields are
 * NULL. Quoted fields follow RFC 4180 (doubled quotes, embedded commas and
 * line breaks).
 */
class TapResultParser {
public:
    /**
     * @throws SyncException (PARSE_ERROR) when the identifier column is missing,
     *         a row has the wrong number of fields or an identifier is not an integer
     */
    static RecordBatch parseCSV(const std::string& csv_data, const SchemaDescriptor& schema);

    /**
     * Split CSV text into rows of fields
     */
    static std::vector<std::vector<std::string>> splitCSV(const std::string& csv_data);
};

} // namespace gaiasync
} // namespace ocl
