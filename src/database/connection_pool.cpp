#include <pgbulk/database/connection_pool.hpp>
#include <pgbulk/errors.hpp>

namespace PgBulk {

ConnectionPool::Lease::Lease(ConnectionPool& pool, std::unique_ptr<PostgresConnection> conn)
    : pool_(&pool), conn_(std::move(conn)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)) {
    other.pool_ = nullptr;
}

ConnectionPool::Lease::~Lease() {
    if (pool_ && conn_) {
        pool_->release(std::move(conn_));
    }
}

ConnectionPool::ConnectionPool(std::string conninfo, size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections) {
    if (max_connections_ == 0) {
        throw ConfigurationError("connection pool needs at least one connection");
    }
}

ConnectionPool::~ConnectionPool() {
    close();
}

std::unique_ptr<PostgresConnection> ConnectionPool::open_connection() const {
    if (conninfo_.empty()) {
        return std::make_unique<PostgresConnection>();
    }
    return std::make_unique<PostgresConnection>(conninfo_);
}

ConnectionPool::Lease ConnectionPool::acquire() {
    std::unique_ptr<PostgresConnection> conn;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || in_use_ < max_connections_; });
        if (closed_) {
            throw DatabaseError("connection pool is closed");
        }
        ++in_use_;
        if (!idle_.empty()) {
            conn = std::move(idle_.front());
            idle_.pop_front();
        }
    }

    if (!conn || !conn->is_connected()) {
        try {
            conn = open_connection();
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                --in_use_;
            }
            cv_.notify_one();
            throw;
        }
    }

    return Lease(*this, std::move(conn));
}

void ConnectionPool::release(std::unique_ptr<PostgresConnection> conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_use_;
        if (!closed_ && conn->is_connected() && !conn->in_copy()) {
            idle_.push_back(std::move(conn));
        }
    }
    cv_.notify_one();
}

void ConnectionPool::close() {
    std::deque<std::unique_ptr<PostgresConnection>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        drained.swap(idle_);
    }
    cv_.notify_all();
}

size_t ConnectionPool::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

size_t ConnectionPool::in_use_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

} // namespace PgBulk
