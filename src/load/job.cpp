#include <pgbulk/load/job.hpp>
#include <pgbulk/errors.hpp>
#include <pgbulk/io/file_discovery.hpp>
#include <pgbulk/load/sql_builder.hpp>
#include <pgbulk/load/strategy_selector.hpp>
#include <pgbulk/schema/catalog_inspector.hpp>
#include <pgbulk/schema/schema_guard.hpp>
#include <pgbulk/utils/time.hpp>

namespace PgBulk {

namespace {

JobConfig validated(JobConfig config) {
    config.validate();
    return config;
}

// Clears the running flag however start() leaves
struct RunningFlag {
    explicit RunningFlag(std::atomic<bool>& flag) : flag_(flag) {
        if (flag_.exchange(true)) {
            throw Error("job is already running");
        }
    }
    ~RunningFlag() { flag_ = false; }

    std::atomic<bool>& flag_;
};

} // namespace

Job::Job(JobConfig config, JobHooks hooks, std::shared_ptr<Logger> logger)
    : config_(validated(std::move(config))),
      hooks_(std::move(hooks)),
      logger_(logger ? std::move(logger) : make_logger(config_.quiet)),
      mapper_(config_.tables),
      using_staging_(requires_staging(config_)),
      pool_(std::make_unique<ConnectionPool>(config_.connection, config_.max_connections)) {}

Job::~Job() = default;

size_t Job::register_files(const std::string& directory, const std::string& pattern) {
    if (running_) {
        throw Error("cannot register files while the job is running");
    }

    auto found = discover_files(directory, pattern);
    files_.insert(files_.end(), found.begin(), found.end());

    logger_->info("Registered " + std::to_string(found.size()) + " file(s) from " + directory +
                  " matching '" + pattern + "'");
    return found.size();
}

LoadReport Job::start() {
    if (files_.empty()) {
        throw ConfigurationError("no files registered");
    }
    RunningFlag running(running_);

    auto lease = pool_->acquire();
    return run(*lease);
}

void Job::end() {
    pool_->close();
}

LoadReport Job::run(PostgresConnection& db) {
    Timer total;
    LoadReport report;
    report.files = files_.size();
    report.used_staging = using_staging_;

    logger_->info("Loading " + std::to_string(files_.size()) + " file(s) into " +
                  std::to_string(config_.tables.size()) + " table(s), " +
                  (using_staging_ ? "via staging table " + config_.staging_table_name() : "direct COPY"));

    PostgresConnection::Transaction txn(db);

    std::string search_path = search_path_sql(config_);
    if (!search_path.empty()) db.execute(search_path, {config_.schema});

    if (using_staging_) {
        db.execute(create_staging_table_sql(config_));
    }

    CatalogInspector inspector(db, config_.schema);
    GuardOptions guard_options;
    guard_options.drop_indexes = config_.drop_indexes;
    guard_options.drop_foreign_keys = config_.drop_foreign_keys;
    guard_options.drop_unique_indexes = config_.drop_unique_indexes;
    SchemaGuard guard(db, inspector, config_.table_names(), guard_options, *logger_);
    guard.capture();

    Timer phase;
    logger_->step("Copying rows");
    report.rows_copied = copy_files(db);
    logger_->success("Copied " + std::to_string(report.rows_copied) + " row(s) in " + phase.elapsed_str());

    if (using_staging_) {
        db.execute(analyze_sql(config_.staging_table_name()));
    }

    guard.drop();

    if (using_staging_) {
        phase.reset();
        logger_->step("Merging staged rows");
        db.execute(merge_sql(config_));
        logger_->success("Merged into " + std::to_string(config_.tables.size()) + " table(s) in " + phase.elapsed_str());
    }

    phase.reset();
    guard.recreate();
    guard.verify();
    report.indexes_rebuilt = guard.snapshot().indexes.size();
    report.constraints_rebuilt = guard.snapshot().constraints.size();
    if (!guard.snapshot().empty()) {
        logger_->success("Rebuilt and verified " + std::to_string(report.indexes_rebuilt) + " index(es) and " +
                         std::to_string(report.constraints_rebuilt) + " constraint(s) in " + phase.elapsed_str());
    }

    for (const auto& table : config_.tables) {
        db.execute(analyze_sql(table.name));
    }

    if (hooks_.on_finish) {
        hooks_.on_finish(db);
    }

    txn.commit();

    report.elapsed_ms = total.elapsed_ms();
    logger_->success("Load committed in " + total.elapsed_str());
    return report;
}

size_t Job::copy_files(PostgresConnection& db) {
    db.copy_begin(copy_sql(config_, using_staging_));

    StreamStats stats;
    try {
        stats = stream_files(files_, config_.max_workers, mapper_, config_.csv, hooks_.parse,
                             [&db](const char* data, size_t nbytes) { db.copy_data(data, nbytes); },
                             *logger_);
    } catch (const std::exception& e) {
        logger_->error(std::string("COPY aborted: ") + e.what());
        db.copy_abort(std::string("pgbulk: ") + e.what());
        throw;
    }

    size_t rows = db.copy_end();
    logger_->info("Streamed " + std::to_string(stats.rows) + " row(s) with " +
                  std::to_string(stats.workers) + " file worker(s)");
    return rows;
}

} // namespace PgBulk
