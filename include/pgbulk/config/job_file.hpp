/**
 * @file job_file.hpp
 * @brief JSON job description -> JobConfig + file registrations
 *
 * Example:
 *
 *   {
 *     "name": "users",
 *     "schema": "public",
 *     "drop_indexes": true,
 *     "drop_foreign_keys": true,
 *     "csv": { "headers": ["id", "age", "name", "nickname", "address_id", "street", "state"] },
 *     "tables": [
 *       { "name": "addresses", "columns": [
 *           { "destination": "id", "source": "address_id", "type": "TEXT" },
 *           { "destination": "street", "type": "TEXT" } ] },
 *       { "name": "users", "columns": [
 *           { "destination": "id", "type": "TEXT" },
 *           { "destination": "address", "type": "TEXT", "references": "address_id" } ] }
 *     ],
 *     "files": [ { "directory": "data", "pattern": "users-*.csv" } ]
 *   }
 *
 * Relative directories are resolved against the job file's directory.
 */

#pragma once

#include <pgbulk/load/job_config.hpp>
#include <string>
#include <vector>

namespace PgBulk {

struct FileRegistration {
    std::string directory;
    std::string pattern = "*";
};

struct JobFile {
    JobConfig config;
    std::vector<FileRegistration> files;
};

/**
 * @throws ConfigurationError if the file is unreadable, malformed or invalid
 */
JobFile load_job_file(const std::string& path);

/**
 * @brief Parse JSON text; relative directories are taken from @p base_dir.
 */
JobFile parse_job_file(const std::string& text, const std::string& base_dir = ".");

} // namespace PgBulk
