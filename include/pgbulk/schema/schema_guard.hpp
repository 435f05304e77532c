/**
 * @file schema_guard.hpp
 * @brief Suspends and restores indexes/constraints around a bulk load
 */

#pragma once

#include <pgbulk/database/postgres_connection.hpp>
#include <pgbulk/schema/catalog_inspector.hpp>
#include <pgbulk/utils/logger.hpp>
#include <string>
#include <vector>

namespace PgBulk {

struct SchemaSnapshot {
    std::vector<SchemaObject> indexes;
    std::vector<SchemaObject> constraints;

    bool empty() const { return indexes.empty() && constraints.empty(); }
};

struct GuardOptions {
    bool drop_indexes = false;
    bool drop_foreign_keys = false;
    bool drop_unique_indexes = false;
};

/**
 * @brief Captured -> Dropped -> Recreated -> Verified, all on one transaction.
 *
 * Every step must run in order. A failing step moves the guard to Error and
 * rethrows; the caller is expected to abort the transaction, which brings
 * back whatever was dropped. verify() raises IntegrityError when a captured
 * (name, definition) pair is missing from a fresh catalog listing.
 */
class SchemaGuard {
public:
    enum class State {
        Idle,
        Captured,
        Dropped,
        Recreated,
        Verified,
        Error
    };

    SchemaGuard(PostgresConnection& db, const CatalogInspector& inspector,
                std::vector<std::string> tables, GuardOptions options, Logger& logger);

    void capture();
    void drop();
    void recreate();
    void verify();

    State state() const { return state_; }
    const SchemaSnapshot& snapshot() const { return snapshot_; }

    // Statement text; empty when there is nothing to do
    static std::string drop_indexes_sql(const std::vector<SchemaObject>& indexes);
    static std::string drop_constraints_sql(const std::vector<SchemaObject>& constraints);
    static std::string create_indexes_sql(const std::vector<SchemaObject>& indexes);
    static std::string add_constraints_sql(const std::vector<SchemaObject>& constraints);

    static const char* state_name(State state);

private:
    template <typename Fn>
    void step(State expected, State next, Fn&& fn);

    std::vector<SchemaObject> collect_indexes() const;
    std::vector<SchemaObject> collect_constraints() const;

    PostgresConnection& db_;
    const CatalogInspector& inspector_;
    std::vector<std::string> tables_;
    GuardOptions options_;
    Logger& logger_;

    SchemaSnapshot snapshot_;
    State state_ = State::Idle;
};

} // namespace PgBulk
