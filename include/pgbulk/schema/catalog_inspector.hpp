/**
 * @file catalog_inspector.hpp
 * @brief Reads index and constraint definitions from the system catalogs
 */

#pragma once

#include <pgbulk/database/postgres_connection.hpp>
#include <string>
#include <vector>

namespace PgBulk {

/**
 * @brief A droppable schema object and the DDL that recreates it.
 *
 * For indexes @c definition is the full CREATE INDEX statement; for
 * constraints it is the clause following ADD CONSTRAINT <name>.
 */
struct SchemaObject {
    std::string name;
    std::string definition;
    std::string table;
    std::string schema;
    char kind = 'i';  // 'i' index, otherwise pg_constraint.contype

    bool operator==(const SchemaObject& other) const {
        return name == other.name && definition == other.definition &&
               table == other.table && schema == other.schema;
    }
};

/**
 * @brief Read-only catalog queries scoped to one table.
 *
 * Runs on the caller's connection so results reflect the open transaction.
 */
class CatalogInspector {
public:
    /**
     * @param schema namespace of the tables; empty means current_schema()
     */
    CatalogInspector(PostgresConnection& db, std::string schema);

    /**
     * @brief Indexes on @p table, excluding those owned by a constraint and,
     *        unless @p include_unique, unique ones.
     */
    std::vector<SchemaObject> list_indexes(const std::string& table, bool include_unique = false) const;

    /**
     * @brief Constraints on @p table except primary keys and NOT NULL entries,
     *        foreign keys last.
     */
    std::vector<SchemaObject> list_constraints(const std::string& table) const;

private:
    PostgresConnection& db_;
    std::string schema_;
};

} // namespace PgBulk
