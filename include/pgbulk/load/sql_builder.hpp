/**
 * @file sql_builder.hpp
 * @brief SQL text for the staging table, COPY command and merge step
 */

#pragma once

#include <pgbulk/load/job_config.hpp>
#include <string>
#include <vector>

namespace PgBulk {

/**
 * @brief Staging column names in staging order.
 */
std::vector<std::string> staging_columns(const TableSpecs& tables);

/**
 * @brief CREATE TEMPORARY TABLE "<staging>" ("<table>_<column>" <type>, ...) ON COMMIT DROP
 */
std::string create_staging_table_sql(const JobConfig& config);

/**
 * @brief COPY into the staging table, or straight into the single
 *        destination table when staging is not used.
 */
std::string copy_sql(const JobConfig& config, bool using_staging);

/**
 * @brief SELECT list moving one table's staged columns into place,
 *        with unnest() for expand columns and ::casts applied.
 */
std::string merge_projection(const TableSpec& table);

/**
 * @brief One INSERT ... SELECT ... ON CONFLICT DO NOTHING per table, batched.
 */
std::string merge_sql(const JobConfig& config);

std::string analyze_sql(const std::string& table);

/**
 * @brief Transaction-local search_path change putting the job's schema in
 *        front of the current path, with the schema name as $1. Empty when
 *        no schema is set.
 */
std::string search_path_sql(const JobConfig& config);

} // namespace PgBulk
