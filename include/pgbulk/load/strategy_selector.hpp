#pragma once

#include <pgbulk/load/job_config.hpp>

namespace PgBulk {

/**
 * @brief Whether rows must pass through a staging table.
 *
 * Required when forced, when more than one table is fed, or when any column
 * expands or casts during the merge. Otherwise rows COPY straight into the
 * single destination table.
 */
bool requires_staging(const JobConfig& config);

} // namespace PgBulk
