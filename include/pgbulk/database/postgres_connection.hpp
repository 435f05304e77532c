/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection, query and COPY interface
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace PgBulk {

/**
 * @brief Quote an SQL identifier, doubling embedded quotes.
 */
std::string quote_identifier(const std::string& id);

/**
 * @brief PostgreSQL connection wrapper
 *
 * One connection carries one transaction at a time. Failures are reported as
 * DatabaseError with the server message attached.
 */
class PostgresConnection {
public:
    using Row = std::vector<std::string>;
    using RowCallback = std::function<void(const Row&)>;

    /**
     * @brief Connect using environment variables
     *
     * Uses: PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
     * Defaults: localhost, 5432, postgres, postgres, (no password)
     */
    PostgresConnection();

    /**
     * @brief Connect with explicit connection string
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    // Move OK
    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    bool is_connected() const;

    /**
     * @brief Execute one or more ';'-separated statements (no results expected)
     */
    void execute(const std::string& sql);

    /**
     * @brief Execute a single parameterized statement (no results)
     */
    void execute(const std::string& sql, const std::vector<std::string>& params);

    std::optional<std::string> query_single(const std::string& sql);
    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query with params and iterate rows
     * @param callback Called for each row: callback(row_data). NULL reads as "".
     */
    void query(const std::string& sql, const std::vector<std::string>& params, RowCallback callback);

    void begin();
    void commit();
    void rollback();

    /**
     * @brief Start a COPY ... FROM STDIN. The connection stays in copy mode
     *        until copy_end() or copy_abort().
     */
    void copy_begin(const std::string& copy_sql);

    /**
     * @brief Send a chunk of COPY payload. Blocks while libpq's send buffer is full.
     */
    void copy_data(const char* buffer, size_t nbytes);

    /**
     * @brief Finish COPY and wait for the server's verdict.
     * @return Number of rows the server accepted
     */
    size_t copy_end();

    /**
     * @brief Abandon an active COPY. The server fails the statement with
     *        @p reason; the resulting error is consumed, not thrown.
     */
    void copy_abort(const std::string& reason);

    bool in_copy() const { return in_copy_; }

    /**
     * @brief RAII transaction guard. Rolls back unless committed.
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();
        void rollback();

    private:
        PostgresConnection& conn_;
        bool committed_ = false;
        bool rolled_back_ = false;
    };

    std::string last_error() const;

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void ensure_connected() const;
    void check_result(PGresult* result);
    PGresult* exec_params(const std::string& sql, const std::vector<std::string>& params);

    PGconn* conn_ = nullptr;
    std::string last_error_;
    bool in_copy_ = false;
};

} // namespace PgBulk
