#include "ocl_gaiasync/tap_result_parser.h"
#include <optional>
#include <stdexcept>

namespace ocl {
namespace gaiasync {

std::vector<std::vector<std::string>> TapResultParser::splitCSV(const std::string& csv_data) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool row_has_content = false;

    for (size_t i = 0; i < csv_data.size(); ++i) {
        char c = csv_data[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < csv_data.size() && csv_data[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                row_has_content = true;
                break;
            case ',':
                row.push_back(std::move(field));
                field.clear();
                row_has_content = true;
                break;
            case '\r':
                break;
            case '\n':
                if (row_has_content || !field.empty()) {
                    row.push_back(std::move(field));
                    rows.push_back(std::move(row));
                }
                row.clear();
                field.clear();
                row_has_content = false;
                break;
            default:
                field += c;
                row_has_content = true;
                break;
        }
    }

    if (row_has_content || !field.empty()) {
        row.push_back(std::move(field));
        rows.push_back(std::move(row));
    }

    return rows;
}

RecordBatch TapResultParser::parseCSV(const std::string& csv_data, const SchemaDescriptor& schema) {
    RecordBatch batch;
    auto rows = splitCSV(csv_data);
    if (rows.empty()) {
        // Even a result without rows carries its header line
        throw SyncException(ErrorCode::PARSE_ERROR, "TAP result is empty (no header line)");
    }

    // Header: map each result column to its schema position
    const auto& header = rows.front();
    std::vector<std::optional<size_t>> target(header.size());
    std::optional<size_t> id_field;
    for (size_t i = 0; i < header.size(); ++i) {
        target[i] = schema.indexOf(header[i]);
        if (header[i] == schema.idColumn()) {
            id_field = i;
        }
    }

    if (!id_field.has_value()) {
        throw SyncException(ErrorCode::PARSE_ERROR,
                            "TAP result has no '" + schema.idColumn() + "' column");
    }

    const size_t num_columns = schema.columns().size();
    batch.records.reserve(rows.size() - 1);

    for (size_t r = 1; r < rows.size(); ++r) {
        const auto& fields = rows[r];
        if (fields.size() != header.size()) {
            throw SyncException(ErrorCode::PARSE_ERROR,
                                "TAP result row " + std::to_string(r) + " has " +
                                std::to_string(fields.size()) + " fields, expected " +
                                std::to_string(header.size()));
        }

        CatalogRecord record;
        record.values.resize(num_columns);

        for (size_t i = 0; i < fields.size(); ++i) {
            if (target[i].has_value() && !fields[i].empty()) {
                record.values[*target[i]] = fields[i];
            }
        }

        const std::string& id_text = fields[*id_field];
        try {
            size_t consumed = 0;
            record.source_id = std::stoll(id_text, &consumed);
            if (consumed != id_text.size()) {
                throw std::invalid_argument(id_text);
            }
        } catch (const std::exception&) {
            throw SyncException(ErrorCode::PARSE_ERROR,
                                "Invalid " + schema.idColumn() + " in TAP result row " +
                                std::to_string(r) + ": '" + id_text + "'");
        }

        batch.records.push_back(std::move(record));
    }

    return batch;
}

} // namespace gaiasync
} // namespace ocl
