/**
 * @file test_schema_guard.cpp
 * @brief Index/constraint suspension against a live PostgreSQL
 *
 * Skipped when no database is reachable (see PGBULK_TEST_DATABASE_URL).
 */

#include <gtest/gtest.h>
#include <pgbulk/errors.hpp>
#include <pgbulk/schema/catalog_inspector.hpp>
#include <pgbulk/schema/schema_guard.hpp>
#include <support/fixture_data.hpp>

using namespace PgBulk;
using namespace PgBulk::test_support;

class SchemaGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        db = try_connect();
        if (!db) {
            GTEST_SKIP() << "Database not available - skipping integration test.";
        }
        create_people_schema(*db);
    }

    void TearDown() override {
        if (db) drop_people_schema(*db);
    }

    GuardOptions all_options() const {
        GuardOptions options;
        options.drop_indexes = true;
        options.drop_foreign_keys = true;
        return options;
    }

    size_t live_indexes(const std::string& name) {
        auto n = db->query_single(
            "SELECT count(*) FROM pg_indexes WHERE schemaname = 'pgbulk' AND indexname = $1", {name});
        return n ? std::stoul(*n) : 0;
    }

    std::unique_ptr<PostgresConnection> db;
    NullLogger logger;
    std::vector<std::string> tables = {"addresses", "users"};
};

// ============================================================================
// Catalog listing
// ============================================================================

TEST_F(SchemaGuardTest, InspectorSkipsConstraintOwnedIndexes) {
    CatalogInspector inspector(*db, "pgbulk");

    auto indexes = inspector.list_indexes("users");
    ASSERT_EQ(indexes.size(), 1u);
    EXPECT_EQ(indexes[0].name, "name_index");
    EXPECT_EQ(indexes[0].table, "users");
    EXPECT_NE(indexes[0].definition.find("CREATE INDEX name_index"), std::string::npos);

    EXPECT_TRUE(inspector.list_indexes("addresses").empty());
}

TEST_F(SchemaGuardTest, InspectorListsForeignKeys) {
    CatalogInspector inspector(*db, "pgbulk");

    auto constraints = inspector.list_constraints("users");
    ASSERT_EQ(constraints.size(), 1u);
    EXPECT_EQ(constraints[0].name, "users_address_fkey");
    EXPECT_EQ(constraints[0].kind, 'f');
    EXPECT_EQ(constraints[0].definition.rfind("FOREIGN KEY (address) REFERENCES", 0), 0u);
}

TEST_F(SchemaGuardTest, UniqueIndexesOnlyOnRequest) {
    db->execute("CREATE UNIQUE INDEX nickname_unique ON pgbulk.users (nickname)");
    CatalogInspector inspector(*db, "pgbulk");

    EXPECT_EQ(inspector.list_indexes("users").size(), 1u);
    EXPECT_EQ(inspector.list_indexes("users", true).size(), 2u);
}

// ============================================================================
// Round trip
// ============================================================================

TEST_F(SchemaGuardTest, DropRecreateVerify) {
    PostgresConnection::Transaction txn(*db);
    CatalogInspector inspector(*db, "pgbulk");
    SchemaGuard guard(*db, inspector, tables, all_options(), logger);

    guard.capture();
    EXPECT_EQ(guard.snapshot().indexes.size(), 1u);
    EXPECT_EQ(guard.snapshot().constraints.size(), 1u);

    guard.drop();
    EXPECT_EQ(live_indexes("name_index"), 0u);
    EXPECT_TRUE(inspector.list_constraints("users").empty());

    guard.recreate();
    EXPECT_EQ(live_indexes("name_index"), 1u);

    EXPECT_NO_THROW(guard.verify());
    EXPECT_EQ(guard.state(), SchemaGuard::State::Verified);
}

TEST_F(SchemaGuardTest, NothingCapturedWhenDisabled) {
    PostgresConnection::Transaction txn(*db);
    CatalogInspector inspector(*db, "pgbulk");
    SchemaGuard guard(*db, inspector, tables, GuardOptions{}, logger);

    guard.capture();
    EXPECT_TRUE(guard.snapshot().empty());
    guard.drop();
    EXPECT_EQ(live_indexes("name_index"), 1u);
    guard.recreate();
    guard.verify();
}

TEST_F(SchemaGuardTest, RollbackRestoresDroppedObjects) {
    {
        PostgresConnection::Transaction txn(*db);
        CatalogInspector inspector(*db, "pgbulk");
        SchemaGuard guard(*db, inspector, tables, all_options(), logger);
        guard.capture();
        guard.drop();
        EXPECT_EQ(live_indexes("name_index"), 0u);
    }
    EXPECT_EQ(live_indexes("name_index"), 1u);
}

// ============================================================================
// Failure paths
// ============================================================================

TEST_F(SchemaGuardTest, StepsOutOfOrderRejected) {
    PostgresConnection::Transaction txn(*db);
    CatalogInspector inspector(*db, "pgbulk");
    SchemaGuard guard(*db, inspector, tables, all_options(), logger);

    EXPECT_THROW(guard.drop(), Error);
    guard.capture();
    EXPECT_THROW(guard.capture(), Error);
    EXPECT_THROW(guard.verify(), Error);
}

TEST_F(SchemaGuardTest, IndexMissingAfterRecreateFailsVerify) {
    PostgresConnection::Transaction txn(*db);
    CatalogInspector inspector(*db, "pgbulk");
    SchemaGuard guard(*db, inspector, tables, all_options(), logger);

    guard.capture();
    guard.drop();
    guard.recreate();
    db->execute("DROP INDEX pgbulk.name_index");

    try {
        guard.verify();
        FAIL() << "expected IntegrityError";
    } catch (const IntegrityError& e) {
        EXPECT_NE(std::string(e.what()).find("users.name_index"), std::string::npos) << e.what();
    }
    EXPECT_EQ(guard.state(), SchemaGuard::State::Error);
}

TEST_F(SchemaGuardTest, ChangedDefinitionFailsVerify) {
    PostgresConnection::Transaction txn(*db);
    CatalogInspector inspector(*db, "pgbulk");
    SchemaGuard guard(*db, inspector, tables, all_options(), logger);

    guard.capture();
    guard.drop();
    guard.recreate();
    db->execute("DROP INDEX pgbulk.name_index");
    db->execute("CREATE INDEX name_index ON pgbulk.users (nickname)");

    EXPECT_THROW(guard.verify(), IntegrityError);
    EXPECT_EQ(guard.state(), SchemaGuard::State::Error);
}

TEST_F(SchemaGuardTest, MissingConstraintFailsVerify) {
    PostgresConnection::Transaction txn(*db);
    CatalogInspector inspector(*db, "pgbulk");
    SchemaGuard guard(*db, inspector, tables, all_options(), logger);

    guard.capture();
    guard.drop();
    guard.recreate();
    db->execute("ALTER TABLE pgbulk.users DROP CONSTRAINT users_address_fkey");

    EXPECT_THROW(guard.verify(), IntegrityError);
}
