/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <pgbulk/database/postgres_connection.hpp>
#include <pgbulk/errors.hpp>
#include <cstdlib>
#include <sstream>

namespace PgBulk {

std::string quote_identifier(const std::string& id) {
    std::string out;
    out.reserve(id.size() + 2);
    out.push_back('"');
    for (char c : id) {
        if (c == '"') out.append("\"\"");
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

PostgresConnection::PostgresConnection() {
    // Build connection string from environment
    std::ostringstream conninfo;

    const char* host = std::getenv("PGHOST");
    const char* port = std::getenv("PGPORT");
    const char* dbname = std::getenv("PGDATABASE");
    const char* user = std::getenv("PGUSER");
    const char* password = std::getenv("PGPASSWORD");

    conninfo << "host=" << (host ? host : "localhost") << " ";
    conninfo << "port=" << (port ? port : "5432") << " ";
    conninfo << "dbname=" << (dbname ? dbname : "postgres") << " ";
    conninfo << "user=" << (user ? user : "postgres") << " ";

    if (password) {
        conninfo << "password=" << password << " ";
    }

    connect(conninfo.str());
}

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_), last_error_(std::move(other.last_error_)), in_copy_(other.in_copy_) {
    other.conn_ = nullptr;
    other.in_copy_ = false;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        last_error_ = std::move(other.last_error_);
        in_copy_ = other.in_copy_;
        other.conn_ = nullptr;
        other.in_copy_ = false;
    }
    return *this;
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw DatabaseError("connection failed: " + last_error_);
    }
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PostgresConnection::ensure_connected() const {
    if (!is_connected()) {
        throw DatabaseError("not connected to database");
    }
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK &&
        status != PGRES_COPY_IN && status != PGRES_COPY_OUT) {
        last_error_ = PQerrorMessage(conn_);
        PQclear(result);
        throw DatabaseError("query failed: " + last_error_);
    }
}

PGresult* PostgresConnection::exec_params(const std::string& sql, const std::vector<std::string>& params) {
    ensure_connected();

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    PGresult* result = PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    );

    check_result(result);
    return result;
}

void PostgresConnection::execute(const std::string& sql) {
    ensure_connected();

    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result);
    PQclear(result);
}

void PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    PQclear(exec_params(sql, params));
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql) {
    return query_single(sql, {});
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec_params(sql, params);

    std::optional<std::string> value;

    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::query(const std::string& sql, const std::vector<std::string>& params, RowCallback callback) {
    PGresult* result = exec_params(sql, params);

    int nrows = PQntuples(result);
    int nfields = PQnfields(result);

    for (int i = 0; i < nrows; ++i) {
        Row row;
        row.reserve(nfields);

        for (int j = 0; j < nfields; ++j) {
            row.push_back(PQgetvalue(result, i, j));
        }

        try {
            callback(row);
        } catch (...) {
            PQclear(result);
            throw;
        }
    }

    PQclear(result);
}

void PostgresConnection::begin() {
    execute("BEGIN");
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    if (in_copy_) {
        copy_abort("transaction rolled back");
    }
    execute("ROLLBACK");
}

void PostgresConnection::copy_begin(const std::string& copy_sql) {
    ensure_connected();
    if (in_copy_) {
        throw DatabaseError("COPY already in progress");
    }

    PGresult* result = PQexec(conn_, copy_sql.c_str());
    check_result(result);
    ExecStatusType status = PQresultStatus(result);
    PQclear(result);

    if (status != PGRES_COPY_IN) {
        throw DatabaseError("statement did not enter COPY IN mode: " + copy_sql);
    }
    in_copy_ = true;
}

void PostgresConnection::copy_data(const char* buffer, size_t nbytes) {
    ensure_connected();
    if (!in_copy_) {
        throw DatabaseError("copy_data called outside of COPY");
    }

    int result = PQputCopyData(conn_, buffer, static_cast<int>(nbytes));
    if (result == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw DatabaseError("COPY data failed: " + last_error_);
    }
}

size_t PostgresConnection::copy_end() {
    ensure_connected();
    if (!in_copy_) {
        throw DatabaseError("copy_end called outside of COPY");
    }
    in_copy_ = false;

    if (PQputCopyEnd(conn_, nullptr) == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw DatabaseError("COPY end failed: " + last_error_);
    }

    // After sending end, collect the final result(s)
    size_t rows = 0;
    PGresult* res;
    while ((res = PQgetResult(conn_)) != nullptr) {
        check_result(res);
        const char* tuples = PQcmdTuples(res);
        if (tuples && *tuples) {
            rows = std::strtoull(tuples, nullptr, 10);
        }
        PQclear(res);
    }
    return rows;
}

void PostgresConnection::copy_abort(const std::string& reason) {
    if (!in_copy_ || !conn_) return;
    in_copy_ = false;

    if (PQputCopyEnd(conn_, reason.c_str()) == -1) {
        last_error_ = PQerrorMessage(conn_);
        return;
    }

    // The server answers with the error we asked for
    PGresult* res;
    while ((res = PQgetResult(conn_)) != nullptr) {
        if (PQresultStatus(res) == PGRES_FATAL_ERROR) {
            last_error_ = PQresultErrorMessage(res);
        }
        PQclear(res);
    }
}

std::string PostgresConnection::last_error() const {
    return last_error_;
}

// Transaction RAII
PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.begin();
}

PostgresConnection::Transaction::~Transaction() {
    if (!committed_ && !rolled_back_) {
        try {
            conn_.rollback();
        } catch (const DatabaseError& e) {
            // A dead connection has nothing left to roll back
            conn_.last_error_ = e.what();
        }
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.commit();
    committed_ = true;
}

void PostgresConnection::Transaction::rollback() {
    conn_.rollback();
    rolled_back_ = true;
}

} // namespace PgBulk
