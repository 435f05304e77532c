/**
 * @file job_config.hpp
 * @brief Table/column mapping and job-wide settings for a bulk load
 */

#pragma once

#include <pgbulk/io/csv_reader.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace PgBulk {

/**
 * @brief One destination column and where its value comes from.
 */
struct ColumnSpec {
    std::string destination;
    std::optional<std::string> source;      // input field name, defaults to destination
    std::string sql_type;                   // staging column type
    std::optional<std::string> references;  // copy the value of this input field
    bool expand = false;                    // unnest the staged array into rows
    std::optional<std::string> cast_type;   // cast applied during merge

    const std::string& source_key() const { return source ? *source : destination; }
};

struct TableSpec {
    std::string name;
    std::vector<ColumnSpec> columns;
};

// Declaration order drives staging column order and merge order.
using TableSpecs = std::vector<TableSpec>;

struct JobConfig {
    std::string name = "pgbulk";
    std::string connection;      // libpq conninfo, empty means PG* environment
    std::string schema;          // empty means current_schema()
    std::string staging_table;   // empty means "staging_<name>"

    TableSpecs tables;
    CsvOptions csv;

    bool force_staging = false;
    bool drop_indexes = false;
    bool drop_foreign_keys = false;
    bool drop_unique_indexes = false;
    bool quiet = false;

    size_t max_connections = 30;
    size_t max_workers = 0;      // concurrent file readers, 0 means hardware threads

    std::string staging_table_name() const;

    std::vector<std::string> table_names() const;

    /**
     * @throws ConfigurationError on the first problem found
     */
    void validate() const;
};

/**
 * @brief Name of the staging column holding @p column of @p table.
 */
inline std::string staging_column(const std::string& table, const std::string& column) {
    return table + "_" + column;
}

} // namespace PgBulk
