#include <pgbulk/schema/catalog_inspector.hpp>

namespace PgBulk {

namespace {

const char* const INDEXES_SQL = R"SQL(
    SELECT i.indexname, i.indexdef, i.schemaname
    FROM pg_indexes i
    WHERE i.tablename = $1
      AND i.schemaname = COALESCE(NULLIF($2, ''), current_schema())
      AND ($3::boolean OR i.indexdef NOT ILIKE 'CREATE UNIQUE INDEX%')
      AND NOT EXISTS (
          SELECT 1
          FROM pg_constraint con
          WHERE con.conindid = format('%I.%I', i.schemaname, i.indexname)::regclass
            AND con.contype IN ('p', 'u', 'x')
      )
    ORDER BY i.indexname
)SQL";

const char* const CONSTRAINTS_SQL = R"SQL(
    SELECT con.conname, pg_get_constraintdef(con.oid, true), ns.nspname, con.contype
    FROM pg_constraint con
    JOIN pg_class cl ON con.conrelid = cl.oid
    JOIN pg_namespace ns ON cl.relnamespace = ns.oid
    WHERE cl.relname = $1
      AND ns.nspname = COALESCE(NULLIF($2, ''), current_schema())
      AND con.contype NOT IN ('p', 'n')
    ORDER BY con.contype = 'f', con.conname
)SQL";

} // namespace

CatalogInspector::CatalogInspector(PostgresConnection& db, std::string schema)
    : db_(db), schema_(std::move(schema)) {}

std::vector<SchemaObject> CatalogInspector::list_indexes(const std::string& table, bool include_unique) const {
    std::vector<SchemaObject> indexes;

    db_.query(INDEXES_SQL, {table, schema_, include_unique ? "true" : "false"},
              [&](const PostgresConnection::Row& row) {
                  SchemaObject obj;
                  obj.name = row[0];
                  obj.definition = row[1];
                  obj.table = table;
                  obj.schema = row[2];
                  obj.kind = 'i';
                  indexes.push_back(std::move(obj));
              });

    return indexes;
}

std::vector<SchemaObject> CatalogInspector::list_constraints(const std::string& table) const {
    std::vector<SchemaObject> constraints;

    db_.query(CONSTRAINTS_SQL, {table, schema_},
              [&](const PostgresConnection::Row& row) {
                  SchemaObject obj;
                  obj.name = row[0];
                  obj.definition = row[1];
                  obj.table = table;
                  obj.schema = row[2];
                  obj.kind = row[3].empty() ? 'c' : row[3][0];
                  constraints.push_back(std::move(obj));
              });

    return constraints;
}

} // namespace PgBulk
