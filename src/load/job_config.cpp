#include <pgbulk/load/job_config.hpp>
#include <pgbulk/errors.hpp>
#include <unordered_set>

namespace PgBulk {

std::string JobConfig::staging_table_name() const {
    return staging_table.empty() ? "staging_" + name : staging_table;
}

std::vector<std::string> JobConfig::table_names() const {
    std::vector<std::string> names;
    names.reserve(tables.size());
    for (const auto& t : tables) names.push_back(t.name);
    return names;
}

void JobConfig::validate() const {
    if (tables.empty()) {
        throw ConfigurationError("no tables configured");
    }
    if (max_connections == 0) {
        throw ConfigurationError("max_connections must be positive");
    }
    if (csv.separator == csv.quote) {
        throw ConfigurationError("CSV separator and quote must differ");
    }

    std::unordered_set<std::string> table_seen;
    std::unordered_set<std::string> staging_seen;
    std::unordered_set<std::string> source_keys;

    for (const auto& table : tables) {
        if (table.name.empty()) {
            throw ConfigurationError("table with empty name");
        }
        if (!table_seen.insert(table.name).second) {
            throw ConfigurationError("table '" + table.name + "' declared twice");
        }
        if (table.columns.empty()) {
            throw ConfigurationError("table '" + table.name + "' has no columns");
        }

        std::unordered_set<std::string> dest_seen;
        for (const auto& col : table.columns) {
            if (col.destination.empty()) {
                throw ConfigurationError("table '" + table.name + "' has a column with empty name");
            }
            if (col.sql_type.empty()) {
                throw ConfigurationError("column '" + table.name + "." + col.destination + "' has no type");
            }
            if (!dest_seen.insert(col.destination).second) {
                throw ConfigurationError("column '" + col.destination + "' declared twice in table '" + table.name + "'");
            }
            if (!staging_seen.insert(staging_column(table.name, col.destination)).second) {
                throw ConfigurationError("staging column '" + staging_column(table.name, col.destination) +
                                         "' is ambiguous");
            }
            source_keys.insert(col.source_key());
        }
    }

    for (const auto& table : tables) {
        for (const auto& col : table.columns) {
            if (col.references && !source_keys.count(*col.references)) {
                throw ConfigurationError("column '" + table.name + "." + col.destination +
                                         "' references unknown column '" + *col.references + "'");
            }
        }
    }
}

} // namespace PgBulk
