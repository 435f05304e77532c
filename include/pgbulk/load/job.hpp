/**
 * @file job.hpp
 * @brief Bulk load orchestration: one transaction per start()
 *
 * Lifecycle of start(), all inside one transaction on one pooled connection:
 *   staging table -> capture schema objects -> COPY every file concurrently
 *   -> ANALYZE staging -> drop indexes/constraints -> merge into tables
 *   -> recreate + verify -> ANALYZE tables -> on_finish -> COMMIT
 *
 * Any failure rolls the whole transaction back, so destination tables,
 * indexes and constraints are left exactly as they were.
 */

#pragma once

#include <pgbulk/database/connection_pool.hpp>
#include <pgbulk/database/postgres_connection.hpp>
#include <pgbulk/load/column_mapper.hpp>
#include <pgbulk/load/job_config.hpp>
#include <pgbulk/load/load_pipeline.hpp>
#include <pgbulk/utils/logger.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace PgBulk {

/**
 * @brief Caller-supplied behaviour. Empty functions mean identity / no-op.
 */
struct JobHooks {
    ParseHook parse;

    // Runs last, before COMMIT, on the load's own transaction
    std::function<void(PostgresConnection&)> on_finish;
};

struct LoadReport {
    size_t files = 0;
    size_t rows_copied = 0;
    bool used_staging = false;
    size_t indexes_rebuilt = 0;
    size_t constraints_rebuilt = 0;
    double elapsed_ms = 0.0;
};

class Job {
public:
    /**
     * @throws ConfigurationError if @p config is invalid
     */
    explicit Job(JobConfig config, JobHooks hooks = {}, std::shared_ptr<Logger> logger = nullptr);
    ~Job();

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    /**
     * @brief Append files under @p directory matching @p pattern.
     * @return Number of files added
     */
    size_t register_files(const std::string& directory, const std::string& pattern = "*");

    /**
     * @brief Load every registered file. Not reentrant.
     * @throws ConfigurationError when no file is registered
     */
    LoadReport start();

    /**
     * @brief Release pooled connections. The job cannot start afterwards.
     */
    void end();

    bool using_staging() const { return using_staging_; }
    const std::vector<std::string>& files() const { return files_; }
    const JobConfig& config() const { return config_; }

private:
    LoadReport run(PostgresConnection& db);
    size_t copy_files(PostgresConnection& db);

    JobConfig config_;
    JobHooks hooks_;
    std::shared_ptr<Logger> logger_;
    ColumnMapper mapper_;
    bool using_staging_;

    std::vector<std::string> files_;
    std::unique_ptr<ConnectionPool> pool_;
    std::atomic<bool> running_{false};
};

} // namespace PgBulk
