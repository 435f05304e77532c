#include <pgbulk/config/job_file.hpp>
#include <pgbulk/errors.hpp>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace PgBulk {

namespace {

template <typename T>
T get_or(const json& node, const char* key, const T& fallback) {
    if (!node.contains(key) || node[key].is_null()) return fallback;
    return node[key].get<T>();
}

// JSON parses non-negative integers as unsigned; anything else is rejected
size_t get_count(const json& node, const char* key, size_t fallback, const std::string& where) {
    if (!node.contains(key) || node[key].is_null()) return fallback;
    const json& value = node[key];
    if (!value.is_number_unsigned()) {
        throw ConfigurationError(where + key + " must be a non-negative integer");
    }
    return value.get<size_t>();
}

std::string required_string(const json& node, const char* key, const std::string& where) {
    if (!node.contains(key) || node[key].is_null()) {
        throw ConfigurationError(where + ": missing '" + key + "'");
    }
    return node[key].get<std::string>();
}

std::optional<std::string> optional_string(const json& node, const char* key) {
    if (!node.contains(key) || node[key].is_null()) return std::nullopt;
    return node[key].get<std::string>();
}

char single_char(const json& node, const char* key, char fallback) {
    std::string value = get_or<std::string>(node, key, std::string(1, fallback));
    if (value.size() != 1) {
        throw ConfigurationError(std::string("csv.") + key + " must be a single character");
    }
    return value[0];
}

ColumnSpec parse_column(const json& node, const std::string& table) {
    if (!node.is_object()) {
        throw ConfigurationError("table '" + table + "': every column must be an object");
    }

    ColumnSpec col;
    col.destination = required_string(node, "destination", "table '" + table + "' column");
    col.sql_type = required_string(node, "type", "column '" + table + "." + col.destination + "'");
    col.source = optional_string(node, "source");
    col.references = optional_string(node, "references");
    col.cast_type = optional_string(node, "cast");
    col.expand = get_or<bool>(node, "expand", false);
    return col;
}

CsvOptions parse_csv(const json& root) {
    CsvOptions csv;
    if (!root.contains("csv")) return csv;

    const json& node = root["csv"];
    if (!node.is_object()) {
        throw ConfigurationError("'csv' must be an object");
    }
    csv.headers = get_or<std::vector<std::string>>(node, "headers", {});
    csv.separator = single_char(node, "separator", csv.separator);
    csv.quote = single_char(node, "quote", csv.quote);
    csv.skip_lines = get_count(node, "skip_lines", 0, "csv.");
    return csv;
}

JobFile parse_root(const json& root, const fs::path& base_dir) {
    if (!root.is_object()) {
        throw ConfigurationError("job file must be a JSON object");
    }

    JobFile job;
    JobConfig& cfg = job.config;

    cfg.name = get_or<std::string>(root, "name", cfg.name);
    cfg.connection = get_or<std::string>(root, "connection", "");
    cfg.schema = get_or<std::string>(root, "schema", "");
    cfg.staging_table = get_or<std::string>(root, "staging_table", "");
    cfg.force_staging = get_or<bool>(root, "force_staging", false);
    cfg.drop_indexes = get_or<bool>(root, "drop_indexes", false);
    cfg.drop_foreign_keys = get_or<bool>(root, "drop_foreign_keys", false);
    cfg.drop_unique_indexes = get_or<bool>(root, "drop_unique_indexes", false);
    cfg.quiet = get_or<bool>(root, "quiet", false);
    cfg.max_connections = get_count(root, "max_connections", cfg.max_connections, "");
    cfg.max_workers = get_count(root, "max_workers", cfg.max_workers, "");
    cfg.csv = parse_csv(root);

    if (!root.contains("tables") || !root["tables"].is_array()) {
        throw ConfigurationError("'tables' must be a list");
    }
    for (const auto& t : root["tables"]) {
        if (!t.is_object()) {
            throw ConfigurationError("every table must be an object");
        }
        TableSpec table;
        table.name = required_string(t, "name", "table");

        if (!t.contains("columns") || !t["columns"].is_array()) {
            throw ConfigurationError("table '" + table.name + "': 'columns' must be a list");
        }
        for (const auto& c : t["columns"]) {
            table.columns.push_back(parse_column(c, table.name));
        }
        cfg.tables.push_back(std::move(table));
    }

    if (root.contains("files")) {
        if (!root["files"].is_array()) {
            throw ConfigurationError("'files' must be a list");
        }
        for (const auto& f : root["files"]) {
            FileRegistration reg;
            fs::path dir = required_string(f, "directory", "files entry");
            if (dir.is_relative()) dir = base_dir / dir;
            reg.directory = dir.lexically_normal().string();
            reg.pattern = get_or<std::string>(f, "pattern", "*");
            job.files.push_back(std::move(reg));
        }
    }

    cfg.validate();
    return job;
}

} // namespace

JobFile parse_job_file(const std::string& text, const std::string& base_dir) {
    try {
        return parse_root(json::parse(text), fs::path(base_dir));
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("invalid job file: ") + e.what());
    }
}

JobFile load_job_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigurationError("cannot open job file " + path);
    }

    fs::path base = fs::absolute(fs::path(path)).parent_path();
    try {
        return parse_root(json::parse(file), base);
    } catch (const json::exception& e) {
        throw ConfigurationError(path + ": " + e.what());
    }
}

} // namespace PgBulk
