#include <pgbulk/load/sql_builder.hpp>
#include <pgbulk/database/postgres_connection.hpp>
#include <pgbulk/errors.hpp>
#include <sstream>

namespace PgBulk {

namespace {

std::string join_quoted(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i) out += ", ";
        out += quote_identifier(names[i]);
    }
    return out;
}

} // namespace

std::vector<std::string> staging_columns(const TableSpecs& tables) {
    std::vector<std::string> columns;
    for (const auto& table : tables) {
        for (const auto& col : table.columns) {
            columns.push_back(staging_column(table.name, col.destination));
        }
    }
    return columns;
}

std::string create_staging_table_sql(const JobConfig& config) {
    std::ostringstream sql;
    sql << "CREATE TEMPORARY TABLE " << quote_identifier(config.staging_table_name()) << " (";

    bool first = true;
    for (const auto& table : config.tables) {
        for (const auto& col : table.columns) {
            if (!first) sql << ", ";
            first = false;
            sql << quote_identifier(staging_column(table.name, col.destination)) << " " << col.sql_type;
        }
    }
    // Pooled connections outlive the transaction
    sql << ") ON COMMIT DROP";
    return sql.str();
}

std::string copy_sql(const JobConfig& config, bool using_staging) {
    std::ostringstream sql;

    if (using_staging) {
        sql << "COPY " << quote_identifier(config.staging_table_name())
            << " (" << join_quoted(staging_columns(config.tables)) << ")";
    } else {
        if (config.tables.size() != 1) {
            throw ConfigurationError("direct COPY needs exactly one table");
        }
        const TableSpec& table = config.tables.front();
        std::vector<std::string> columns;
        for (const auto& col : table.columns) columns.push_back(col.destination);

        sql << "COPY " << quote_identifier(table.name) << " (" << join_quoted(columns) << ")";
    }

    sql << " FROM STDIN (FORMAT CSV)";
    return sql.str();
}

std::string merge_projection(const TableSpec& table) {
    std::ostringstream sql;
    for (size_t i = 0; i < table.columns.size(); ++i) {
        const ColumnSpec& col = table.columns[i];
        std::string staged = quote_identifier(staging_column(table.name, col.destination));

        if (i) sql << ", ";
        if (col.expand) sql << "unnest(" << staged << ")";
        else sql << staged;
        if (col.cast_type) sql << "::" << *col.cast_type;
        sql << " AS " << quote_identifier(col.destination);
    }
    return sql.str();
}

std::string merge_sql(const JobConfig& config) {
    std::ostringstream sql;
    const std::string staging = quote_identifier(config.staging_table_name());

    for (size_t i = 0; i < config.tables.size(); ++i) {
        const TableSpec& table = config.tables[i];
        std::vector<std::string> columns;
        for (const auto& col : table.columns) columns.push_back(col.destination);

        if (i) sql << " ";
        sql << "INSERT INTO " << quote_identifier(table.name) << " (" << join_quoted(columns) << ")"
            << " SELECT " << merge_projection(table)
            << " FROM " << staging
            << " ON CONFLICT DO NOTHING;";
    }
    return sql.str();
}

std::string analyze_sql(const std::string& table) {
    return "ANALYZE " + quote_identifier(table);
}

std::string search_path_sql(const JobConfig& config) {
    if (config.schema.empty()) return "";
    // Types and functions installed in public must keep resolving
    return "SELECT set_config('search_path', quote_ident($1) || ', ' || current_setting('search_path'), true)";
}

} // namespace PgBulk
