#include <pgbulk/database/copy_sink.hpp>
#include <pgbulk/errors.hpp>

namespace PgBulk {

CopySink::CopySink(ChunkWriter writer, size_t producers, size_t capacity)
    : writer_(std::move(writer)), capacity_(capacity == 0 ? 1 : capacity), producers_active_(producers) {}

void CopySink::write(std::string chunk, size_t rows) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return queue_.size() < capacity_ || cancelled_; });
        if (cancelled_) {
            throw IoError("copy sink closed: " + cancel_reason_);
        }
        queue_.push(Chunk{std::move(chunk), rows});
    }
    not_empty_.notify_one();
}

void CopySink::producer_done() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (producers_active_ > 0) --producers_active_;
    }
    not_empty_.notify_one();
}

bool CopySink::cancel(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) return false;
        cancelled_ = true;
        cancel_reason_ = reason;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
    return true;
}

void CopySink::drain() {
    while (true) {
        Chunk chunk;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, [this] {
                return !queue_.empty() || producers_active_ == 0 || cancelled_;
            });
            if (cancelled_) return;
            if (queue_.empty()) return; // all producers done
            chunk = std::move(queue_.front());
            queue_.pop();
        }
        not_full_.notify_one();

        try {
            writer_(chunk.data.data(), chunk.data.size());
        } catch (const std::exception& e) {
            cancel(e.what());
            throw;
        } catch (...) {
            cancel("copy writer failed");
            throw;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        rows_written_ += chunk.rows;
        bytes_written_ += chunk.data.size();
    }
}

bool CopySink::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

std::string CopySink::cancel_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_reason_;
}

size_t CopySink::rows_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_written_;
}

size_t CopySink::bytes_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_written_;
}

} // namespace PgBulk
