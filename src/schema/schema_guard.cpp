#include <pgbulk/schema/schema_guard.hpp>
#include <pgbulk/errors.hpp>
#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

namespace PgBulk {

namespace {

std::string qualified(const std::string& schema, const std::string& name) {
    if (schema.empty()) return quote_identifier(name);
    return quote_identifier(schema) + "." + quote_identifier(name);
}

// Names of captured objects with no identical (name, definition) counterpart in fresh
std::vector<std::string> missing_from(const std::vector<SchemaObject>& captured,
                                      const std::vector<SchemaObject>& fresh) {
    std::set<std::pair<std::string, std::string>> live;
    for (const auto& obj : fresh) live.emplace(obj.name, obj.definition);

    std::vector<std::string> missing;
    for (const auto& obj : captured) {
        if (!live.count({obj.name, obj.definition})) missing.push_back(obj.table + "." + obj.name);
    }
    return missing;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ", ";
        out += items[i];
    }
    return out;
}

} // namespace

SchemaGuard::SchemaGuard(PostgresConnection& db, const CatalogInspector& inspector,
                         std::vector<std::string> tables, GuardOptions options, Logger& logger)
    : db_(db), inspector_(inspector), tables_(std::move(tables)), options_(options), logger_(logger) {}

const char* SchemaGuard::state_name(State state) {
    switch (state) {
        case State::Idle:      return "Idle";
        case State::Captured:  return "Captured";
        case State::Dropped:   return "Dropped";
        case State::Recreated: return "Recreated";
        case State::Verified:  return "Verified";
        case State::Error:     return "Error";
    }
    return "Unknown";
}

template <typename Fn>
void SchemaGuard::step(State expected, State next, Fn&& fn) {
    if (state_ != expected) {
        throw Error(std::string("schema guard cannot enter ") + state_name(next) +
                    " from " + state_name(state_));
    }
    try {
        fn();
    } catch (...) {
        state_ = State::Error;
        throw;
    }
    state_ = next;
}

std::vector<SchemaObject> SchemaGuard::collect_indexes() const {
    std::vector<SchemaObject> all;
    for (const auto& table : tables_) {
        auto found = inspector_.list_indexes(table, options_.drop_unique_indexes);
        all.insert(all.end(), found.begin(), found.end());
    }
    return all;
}

std::vector<SchemaObject> SchemaGuard::collect_constraints() const {
    std::vector<SchemaObject> all;
    for (const auto& table : tables_) {
        auto found = inspector_.list_constraints(table);
        all.insert(all.end(), found.begin(), found.end());
    }
    // Foreign keys last across tables too: dropped first, recreated last
    std::stable_partition(all.begin(), all.end(), [](const SchemaObject& obj) { return obj.kind != 'f'; });
    return all;
}

void SchemaGuard::capture() {
    step(State::Idle, State::Captured, [this] {
        if (options_.drop_indexes) snapshot_.indexes = collect_indexes();
        if (options_.drop_foreign_keys) snapshot_.constraints = collect_constraints();

        logger_.info("Captured " + std::to_string(snapshot_.indexes.size()) + " index(es) and " +
                     std::to_string(snapshot_.constraints.size()) + " constraint(s)");
    });
}

void SchemaGuard::drop() {
    step(State::Captured, State::Dropped, [this] {
        std::string sql = drop_indexes_sql(snapshot_.indexes);
        if (!sql.empty()) db_.execute(sql);

        sql = drop_constraints_sql(snapshot_.constraints);
        if (!sql.empty()) db_.execute(sql);
    });
}

void SchemaGuard::recreate() {
    step(State::Dropped, State::Recreated, [this] {
        // Unique constraints may back foreign keys, so constraints first
        std::string sql = add_constraints_sql(snapshot_.constraints);
        if (!sql.empty()) db_.execute(sql);

        sql = create_indexes_sql(snapshot_.indexes);
        if (!sql.empty()) db_.execute(sql);
    });
}

void SchemaGuard::verify() {
    step(State::Recreated, State::Verified, [this] {
        if (options_.drop_indexes) {
            auto missing = missing_from(snapshot_.indexes, collect_indexes());
            if (!missing.empty()) {
                throw IntegrityError("indexes do not match after recreate: " + join(missing));
            }
        }
        if (options_.drop_foreign_keys) {
            auto missing = missing_from(snapshot_.constraints, collect_constraints());
            if (!missing.empty()) {
                throw IntegrityError("constraints do not match after recreate: " + join(missing));
            }
        }
    });
}

std::string SchemaGuard::drop_indexes_sql(const std::vector<SchemaObject>& indexes) {
    if (indexes.empty()) return "";

    std::ostringstream sql;
    sql << "DROP INDEX IF EXISTS ";
    for (size_t i = 0; i < indexes.size(); ++i) {
        if (i) sql << ", ";
        sql << qualified(indexes[i].schema, indexes[i].name);
    }
    sql << " RESTRICT";
    return sql.str();
}

std::string SchemaGuard::drop_constraints_sql(const std::vector<SchemaObject>& constraints) {
    std::ostringstream sql;
    // Reverse of creation order
    for (auto it = constraints.rbegin(); it != constraints.rend(); ++it) {
        if (it != constraints.rbegin()) sql << "; ";
        sql << "ALTER TABLE " << qualified(it->schema, it->table)
            << " DROP CONSTRAINT " << quote_identifier(it->name);
    }
    return sql.str();
}

std::string SchemaGuard::create_indexes_sql(const std::vector<SchemaObject>& indexes) {
    std::ostringstream sql;
    for (size_t i = 0; i < indexes.size(); ++i) {
        if (i) sql << "; ";
        sql << indexes[i].definition;
    }
    return sql.str();
}

std::string SchemaGuard::add_constraints_sql(const std::vector<SchemaObject>& constraints) {
    std::ostringstream sql;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i) sql << "; ";
        sql << "ALTER TABLE " << qualified(constraints[i].schema, constraints[i].table)
            << " ADD CONSTRAINT " << quote_identifier(constraints[i].name)
            << " " << constraints[i].definition;
    }
    return sql.str();
}

} // namespace PgBulk
