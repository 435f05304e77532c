/**
 * @file connection_pool.hpp
 * @brief Bounded pool of PostgresConnections
 */

#pragma once

#include <pgbulk/database/postgres_connection.hpp>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace PgBulk {

/**
 * @brief Bounded, lazily-populated connection pool.
 *
 * acquire() blocks while max_connections leases are outstanding. A lease
 * returns its connection on destruction; broken connections are dropped
 * instead of being recycled. close() empties the pool and makes further
 * acquires fail.
 */
class ConnectionPool {
public:
    class Lease {
    public:
        Lease(ConnectionPool& pool, std::unique_ptr<PostgresConnection> conn);
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept;

        PostgresConnection& operator*() const { return *conn_; }
        PostgresConnection* operator->() const { return conn_.get(); }

    private:
        ConnectionPool* pool_;
        std::unique_ptr<PostgresConnection> conn_;
    };

    /**
     * @param conninfo libpq connection string; empty means PG* environment
     */
    explicit ConnectionPool(std::string conninfo, size_t max_connections = 30);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Lease acquire();

    void close();

    size_t idle_count() const;
    size_t in_use_count() const;
    size_t max_connections() const { return max_connections_; }

private:
    void release(std::unique_ptr<PostgresConnection> conn);
    std::unique_ptr<PostgresConnection> open_connection() const;

    std::string conninfo_;
    size_t max_connections_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<PostgresConnection>> idle_;
    size_t in_use_ = 0;
    bool closed_ = false;
};

} // namespace PgBulk
