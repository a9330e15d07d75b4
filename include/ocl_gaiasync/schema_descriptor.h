#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ocl {
namespace gaiasync {

/**
 * Storage class of a catalog column
 */
enum class ColumnType {
    INTEGER,
    REAL,
    TEXT,
    BOOLEAN      ///< Stored as 0/1, received as "true"/"false"
};

/**
 * One catalog column
 */
struct ColumnSpec {
    std::string name;
    ColumnType type;
    bool not_null = false;
};

/**
 * Schema Descriptor - ordered column list shared by the downloader and the store
 *
 * The descriptor names the remote table the records come from, the local
 * table they are stored in, and the identifier column that is unique within
 * a region. Column order is significant: it is the SELECT order of the
 * remote query and the value order of every CatalogRecord.
 *
 * Example usage:
 * @code
 *   auto schema = SchemaDescriptor::gaiaDR2();
 *   std::cout << schema.remoteTable() << " has "
 *             << schema.columns().size() << " columns\n";
 * @endcode
 */
class SchemaDescriptor {
public:
    /**
     * @param store_table Local table name
     * @param remote_table Remote table name (e.g. "gaiadr2.gaia_source")
     * @param columns Ordered columns, must contain id_column
     * @param id_column Record identifier column
     * @throws SyncException (INVALID_PARAMS) for duplicate or unsafe column names,
     *         or when the identifier column is missing
     */
    SchemaDescriptor(std::string store_table,
                     std::string remote_table,
                     std::vector<ColumnSpec> columns,
                     std::string id_column = "source_id");

    /**
     * Gaia DR2 gaia_source, versioned schema used by default
     */
    static const SchemaDescriptor& gaiaDR2();

    const std::string& storeTable() const { return store_table_; }
    const std::string& remoteTable() const { return remote_table_; }
    const std::string& idColumn() const { return id_column_; }
    const std::vector<ColumnSpec>& columns() const { return columns_; }

    size_t idColumnIndex() const { return id_index_; }

    std::vector<std::string> columnNames() const;

    std::optional<size_t> indexOf(const std::string& column) const;

    /**
     * Identifiers are interpolated into SQL/ADQL, so only [A-Za-z0-9_.] is accepted
     */
    static bool isSafeIdentifier(const std::string& name);

private:
    std::string store_table_;
    std::string remote_table_;
    std::vector<ColumnSpec> columns_;
    std::string id_column_;
    size_t id_index_;
};

} // namespace gaiasync
} // namespace ocl
