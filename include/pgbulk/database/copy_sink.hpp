/**
 * @file copy_sink.hpp
 * @brief Single-writer COPY sink shared by concurrent file pipelines
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>

namespace PgBulk {

/**
 * @brief Bounded queue between many row producers and one COPY writer.
 *
 * Producers hand over chunks of complete serialized rows; write() blocks
 * while the queue is full, which is how COPY backpressure reaches the file
 * readers. The thread that owns the connection calls drain(), the only
 * place the chunk writer runs. A chunk is never split, so rows from
 * different producers interleave but never tear.
 *
 * cancel() wakes everybody: pending and later write() calls throw IoError
 * and drain() returns without writing the rest.
 */
class CopySink {
public:
    using ChunkWriter = std::function<void(const char* data, size_t nbytes)>;

    static constexpr size_t DEFAULT_CAPACITY = 16;

    CopySink(ChunkWriter writer, size_t producers, size_t capacity = DEFAULT_CAPACITY);

    CopySink(const CopySink&) = delete;
    CopySink& operator=(const CopySink&) = delete;

    /**
     * @brief Enqueue a chunk holding @p rows complete rows. Blocks when full.
     * @throws IoError if the sink was cancelled
     */
    void write(std::string chunk, size_t rows);

    /**
     * @brief Called exactly once by each producer when it stops writing.
     */
    void producer_done();

    /**
     * @brief Stop the sink. The first reason wins.
     * @return true for the call that actually cancelled
     */
    bool cancel(const std::string& reason);

    /**
     * @brief Write chunks until every producer is done and the queue is empty,
     *        or until the sink is cancelled. Writer exceptions cancel the sink
     *        and propagate.
     */
    void drain();

    bool cancelled() const;
    std::string cancel_reason() const;

    size_t rows_written() const;
    size_t bytes_written() const;

private:
    struct Chunk {
        std::string data;
        size_t rows;
    };

    ChunkWriter writer_;
    size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::queue<Chunk> queue_;
    size_t producers_active_;
    bool cancelled_ = false;
    std::string cancel_reason_;

    size_t rows_written_ = 0;
    size_t bytes_written_ = 0;
};

} // namespace PgBulk
