/**
 * @file test_sql_builder.cpp
 * @brief Staging, COPY and merge statement text
 */

#include <gtest/gtest.h>
#include <pgbulk/errors.hpp>
#include <pgbulk/load/sql_builder.hpp>
#include <support/fixture_data.hpp>

using namespace PgBulk;

static JobConfig people_config(bool with_users) {
    JobConfig config;
    config.tables = test_support::people_tables(with_users);
    return config;
}

// ============================================================================
// Staging table
// ============================================================================

TEST(SqlBuilderTest, StagingColumnsPrefixedWithTable) {
    std::vector<std::string> expected = {
        "addresses_id", "addresses_street", "addresses_state",
        "users_id", "users_age", "users_name", "users_nickname", "users_address"};
    EXPECT_EQ(staging_columns(people_config(true).tables), expected);
}

TEST(SqlBuilderTest, CreateStagingTable) {
    JobConfig config = people_config(false);
    EXPECT_EQ(create_staging_table_sql(config),
              "CREATE TEMPORARY TABLE \"staging_pgbulk\" ("
              "\"addresses_id\" TEXT, \"addresses_street\" TEXT, \"addresses_state\" TEXT"
              ") ON COMMIT DROP");
}

TEST(SqlBuilderTest, StagingTableNameOverride) {
    JobConfig config = people_config(false);
    config.staging_table = "load \"tmp\"";
    EXPECT_EQ(create_staging_table_sql(config).rfind("CREATE TEMPORARY TABLE \"load \"\"tmp\"\"\" (", 0), 0u);
}

// ============================================================================
// COPY
// ============================================================================

TEST(SqlBuilderTest, CopyIntoStaging) {
    JobConfig config = people_config(false);
    EXPECT_EQ(copy_sql(config, true),
              "COPY \"staging_pgbulk\" (\"addresses_id\", \"addresses_street\", \"addresses_state\")"
              " FROM STDIN (FORMAT CSV)");
}

TEST(SqlBuilderTest, DirectCopyUsesDestinationColumns) {
    JobConfig config = people_config(false);
    EXPECT_EQ(copy_sql(config, false),
              "COPY \"addresses\" (\"id\", \"street\", \"state\") FROM STDIN (FORMAT CSV)");
}

TEST(SqlBuilderTest, DirectCopyRejectsSeveralTables) {
    EXPECT_THROW(copy_sql(people_config(true), false), ConfigurationError);
}

// ============================================================================
// Merge
// ============================================================================

TEST(SqlBuilderTest, MergeOneStatementPerTable) {
    std::string sql = merge_sql(people_config(true));

    EXPECT_EQ(sql,
              "INSERT INTO \"addresses\" (\"id\", \"street\", \"state\") SELECT "
              "\"addresses_id\" AS \"id\", \"addresses_street\" AS \"street\", \"addresses_state\" AS \"state\""
              " FROM \"staging_pgbulk\" ON CONFLICT DO NOTHING; "
              "INSERT INTO \"users\" (\"id\", \"age\", \"name\", \"nickname\", \"address\") SELECT "
              "\"users_id\" AS \"id\", \"users_age\" AS \"age\", \"users_name\" AS \"name\", "
              "\"users_nickname\" AS \"nickname\", \"users_address\" AS \"address\""
              " FROM \"staging_pgbulk\" ON CONFLICT DO NOTHING;");
}

TEST(SqlBuilderTest, ExpandAndCastInProjection) {
    TableSpec tags;
    tags.name = "tags";
    tags.columns.push_back({"post_id", std::nullopt, "BIGINT", std::nullopt, false, std::nullopt});
    tags.columns.push_back({"tag", std::string("tags"), "TEXT[]", std::nullopt, true, std::nullopt});
    tags.columns.push_back({"weight", std::nullopt, "TEXT", std::nullopt, false, std::string("NUMERIC(6,2)")});

    EXPECT_EQ(merge_projection(tags),
              "\"tags_post_id\" AS \"post_id\", unnest(\"tags_tag\") AS \"tag\", "
              "\"tags_weight\"::NUMERIC(6,2) AS \"weight\"");
}

// ============================================================================
// Session statements
// ============================================================================

TEST(SqlBuilderTest, AnalyzeQuotesTable) {
    EXPECT_EQ(analyze_sql("Users"), "ANALYZE \"Users\"");
}

TEST(SqlBuilderTest, SearchPathPrependsSchemaOnlyWhenSet) {
    JobConfig config = people_config(false);
    EXPECT_EQ(search_path_sql(config), "");

    config.schema = "pgbulk";
    EXPECT_EQ(search_path_sql(config),
              "SELECT set_config('search_path', quote_ident($1) || ', ' || current_setting('search_path'), true)");
}
