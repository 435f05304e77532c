/**
 * @file test_job_file.cpp
 * @brief JSON job description parsing, and Job setup that needs no database
 */

#include <gtest/gtest.h>
#include <pgbulk/config/job_file.hpp>
#include <pgbulk/errors.hpp>
#include <pgbulk/load/job.hpp>
#include <support/fixture_data.hpp>

using namespace PgBulk;
using namespace PgBulk::test_support;

static const char* PEOPLE_JOB = R"({
  "name": "people",
  "schema": "pgbulk",
  "drop_indexes": true,
  "drop_foreign_keys": true,
  "max_connections": 4,
  "csv": {
    "headers": ["id", "age", "name", "nickname", "address_id", "street", "state"],
    "separator": ";"
  },
  "tables": [
    { "name": "addresses", "columns": [
      { "destination": "id", "source": "address_id", "type": "TEXT" },
      { "destination": "street", "type": "TEXT" },
      { "destination": "state", "type": "TEXT" }
    ]},
    { "name": "users", "columns": [
      { "destination": "id", "type": "TEXT" },
      { "destination": "age", "type": "TEXT", "cast": "INT" },
      { "destination": "tags", "source": "nickname", "type": "TEXT[]", "expand": true },
      { "destination": "address", "type": "TEXT", "references": "address_id" }
    ]}
  ],
  "files": [
    { "directory": "data", "pattern": "users-*.csv" },
    { "directory": "/var/lib/pgbulk" }
  ]
})";

// ============================================================================
// Parsing
// ============================================================================

TEST(JobFileTest, ParsesSettingsAndTables) {
    JobFile job = parse_job_file(PEOPLE_JOB, "/srv/jobs");
    const JobConfig& cfg = job.config;

    EXPECT_EQ(cfg.name, "people");
    EXPECT_EQ(cfg.schema, "pgbulk");
    EXPECT_EQ(cfg.staging_table_name(), "staging_people");
    EXPECT_TRUE(cfg.drop_indexes);
    EXPECT_TRUE(cfg.drop_foreign_keys);
    EXPECT_FALSE(cfg.drop_unique_indexes);
    EXPECT_FALSE(cfg.force_staging);
    EXPECT_EQ(cfg.max_connections, 4u);
    EXPECT_EQ(cfg.csv.separator, ';');
    EXPECT_EQ(cfg.csv.quote, '"');
    EXPECT_EQ(cfg.csv.headers, people_headers());

    ASSERT_EQ(cfg.tables.size(), 2u);
    const TableSpec& users = cfg.tables[1];
    ASSERT_EQ(users.columns.size(), 4u);

    EXPECT_EQ(cfg.tables[0].columns[0].source_key(), "address_id");
    EXPECT_EQ(users.columns[1].cast_type, std::optional<std::string>("INT"));
    EXPECT_TRUE(users.columns[2].expand);
    EXPECT_EQ(users.columns[2].sql_type, "TEXT[]");
    EXPECT_EQ(users.columns[3].references, std::optional<std::string>("address_id"));
    EXPECT_FALSE(users.columns[0].source.has_value());
}

TEST(JobFileTest, RelativeDirectoriesResolveAgainstBase) {
    JobFile job = parse_job_file(PEOPLE_JOB, "/srv/jobs");
    ASSERT_EQ(job.files.size(), 2u);
    EXPECT_EQ(job.files[0].directory, "/srv/jobs/data");
    EXPECT_EQ(job.files[0].pattern, "users-*.csv");
    EXPECT_EQ(job.files[1].directory, "/var/lib/pgbulk");
    EXPECT_EQ(job.files[1].pattern, "*");
}

TEST(JobFileTest, DefaultsWhenKeysAbsent) {
    JobFile job = parse_job_file(R"({
      "tables": [ { "name": "addresses", "columns": [ { "destination": "id", "type": "TEXT" } ] } ]
    })");
    EXPECT_EQ(job.config.name, "pgbulk");
    EXPECT_TRUE(job.config.connection.empty());
    EXPECT_TRUE(job.config.schema.empty());
    EXPECT_EQ(job.config.max_connections, 30u);
    EXPECT_EQ(job.config.max_workers, 0u);
    EXPECT_TRUE(job.config.csv.headers.empty());
    EXPECT_TRUE(job.files.empty());
}

TEST(JobFileTest, MissingTablesRejected) {
    EXPECT_THROW(parse_job_file(R"({ "name": "x" })"), ConfigurationError);
}

TEST(JobFileTest, ColumnWithoutTypeRejected) {
    EXPECT_THROW(parse_job_file(R"({
      "tables": [ { "name": "addresses", "columns": [ { "destination": "id" } ] } ]
    })"), ConfigurationError);
}

TEST(JobFileTest, MultiCharacterSeparatorRejected) {
    EXPECT_THROW(parse_job_file(R"({
      "csv": { "separator": "||" },
      "tables": [ { "name": "a", "columns": [ { "destination": "id", "type": "TEXT" } ] } ]
    })"), ConfigurationError);
}

TEST(JobFileTest, WrongValueTypeRejected) {
    EXPECT_THROW(parse_job_file(R"({
      "max_connections": "many",
      "tables": [ { "name": "a", "columns": [ { "destination": "id", "type": "TEXT" } ] } ]
    })"), ConfigurationError);
}

TEST(JobFileTest, NegativeCountsRejected) {
    EXPECT_THROW(parse_job_file(R"({
      "csv": { "skip_lines": -1 },
      "tables": [ { "name": "a", "columns": [ { "destination": "id", "type": "TEXT" } ] } ]
    })"), ConfigurationError);

    EXPECT_THROW(parse_job_file(R"({
      "max_connections": -1,
      "tables": [ { "name": "a", "columns": [ { "destination": "id", "type": "TEXT" } ] } ]
    })"), ConfigurationError);

    EXPECT_THROW(parse_job_file(R"({
      "max_workers": -4,
      "tables": [ { "name": "a", "columns": [ { "destination": "id", "type": "TEXT" } ] } ]
    })"), ConfigurationError);
}

TEST(JobFileTest, FractionalCountRejected) {
    EXPECT_THROW(parse_job_file(R"({
      "max_workers": 2.5,
      "tables": [ { "name": "a", "columns": [ { "destination": "id", "type": "TEXT" } ] } ]
    })"), ConfigurationError);
}

TEST(JobFileTest, CountsParsed) {
    JobFile job = parse_job_file(R"({
      "max_workers": 8,
      "csv": { "skip_lines": 2 },
      "tables": [ { "name": "a", "columns": [ { "destination": "id", "type": "TEXT" } ] } ]
    })");
    EXPECT_EQ(job.config.max_workers, 8u);
    EXPECT_EQ(job.config.csv.skip_lines, 2u);
}

TEST(JobFileTest, MalformedJsonRejected) {
    EXPECT_THROW(parse_job_file(R"({ "tables": [ )"), ConfigurationError);
    EXPECT_THROW(parse_job_file("[]"), ConfigurationError);
}

TEST(JobFileTest, UnresolvedReferenceRejected) {
    EXPECT_THROW(parse_job_file(R"({
      "tables": [ { "name": "users", "columns": [
        { "destination": "address", "type": "TEXT", "references": "address_id" } ] } ]
    })"), ConfigurationError);
}

TEST(JobFileTest, LoadFromDisk) {
    TempDir dir;
    std::string path = dir.file("job.json");
    write_text(path, PEOPLE_JOB);

    JobFile job = load_job_file(path);
    EXPECT_EQ(job.config.name, "people");
    EXPECT_EQ(job.files[0].directory, dir.path() + "/data");
}

TEST(JobFileTest, MissingFileRejected) {
    EXPECT_THROW(load_job_file("/nonexistent/pgbulk/job.json"), ConfigurationError);
}

// ============================================================================
// Job setup (no connection is opened until start())
// ============================================================================

static JobConfig offline_config(bool with_users) {
    JobConfig config;
    config.tables = people_tables(with_users);
    config.quiet = true;
    config.connection = "host=/nonexistent/pgbulk-socket dbname=none connect_timeout=1";
    return config;
}

TEST(JobSetupTest, StrategyFixedAtConstruction) {
    EXPECT_TRUE(Job(offline_config(true)).using_staging());
    EXPECT_FALSE(Job(offline_config(false)).using_staging());
}

TEST(JobSetupTest, InvalidConfigRejected) {
    JobConfig config = offline_config(true);
    config.tables[1].columns[4].references = "missing";
    EXPECT_THROW(Job{config}, ConfigurationError);
}

TEST(JobSetupTest, StartWithoutFilesFailsBeforeConnecting) {
    Job job(offline_config(true), {}, std::make_shared<NullLogger>());
    EXPECT_THROW(job.start(), ConfigurationError);
}

TEST(JobSetupTest, RegisterFilesAccumulates) {
    TempDir dir;
    write_text(dir.file("a.csv"), "");
    write_text(dir.file("b.csv"), "");
    write_text(dir.file("c.txt"), "");

    Job job(offline_config(false), {}, std::make_shared<NullLogger>());
    EXPECT_EQ(job.register_files(dir.path(), "*.csv"), 2u);
    EXPECT_EQ(job.register_files(dir.path(), "*.txt"), 1u);
    EXPECT_EQ(job.files().size(), 3u);
}

TEST(JobSetupTest, RegisterMissingDirectoryRejected) {
    Job job(offline_config(false), {}, std::make_shared<NullLogger>());
    EXPECT_THROW(job.register_files("/nonexistent/pgbulk/data"), ConfigurationError);
}
