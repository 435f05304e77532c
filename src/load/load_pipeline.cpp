#include <pgbulk/load/load_pipeline.hpp>
#include <pgbulk/errors.hpp>
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace PgBulk {

LoadPipeline::LoadPipeline(const ColumnMapper& mapper, const CsvOptions& csv, const ParseHook& hook, CopySink& sink) noexcept
    : mapper_(mapper), csv_(csv), hook_(hook), sink_(sink) {}

size_t LoadPipeline::run(const std::string& path) {
    CsvReader reader(path, csv_);

    Record record;
    Record parsed;
    StagingRow row;
    std::string chunk;
    chunk.reserve(CHUNK_BYTES + 4096);

    size_t total = 0;
    size_t in_chunk = 0;

    while (reader.next(record)) {
        const Record* source = &record;

        if (hook_) {
            try {
                parsed = hook_(std::move(record));
            } catch (const std::exception& e) {
                throw IoError(path + ":" + std::to_string(reader.record_line()) +
                              ": parse hook failed: " + e.what());
            }
            source = &parsed;
        }

        mapper_.map_into(*source, row);
        writer_.append_row(chunk, row);
        ++in_chunk;

        if (in_chunk >= CHUNK_ROWS || chunk.size() >= CHUNK_BYTES) {
            sink_.write(std::move(chunk), in_chunk);
            total += in_chunk;
            in_chunk = 0;
            chunk = std::string();
            chunk.reserve(CHUNK_BYTES + 4096);
        }
    }

    if (in_chunk > 0) {
        sink_.write(std::move(chunk), in_chunk);
        total += in_chunk;
    }

    return total;
}

size_t worker_count(size_t files, size_t max_workers) {
    size_t limit = max_workers;
    if (limit == 0) {
        limit = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    return std::min(files, limit);
}

StreamStats stream_files(const std::vector<std::string>& files, size_t max_workers,
                         const ColumnMapper& mapper, const CsvOptions& csv, const ParseHook& hook,
                         CopySink::ChunkWriter writer, Logger& logger) {
    StreamStats stats;
    stats.workers = worker_count(files.size(), max_workers);

    CopySink sink(std::move(writer), stats.workers);

    std::atomic<size_t> next{0};
    std::mutex failure_mutex;
    std::exception_ptr failure;

    auto record_failure = [&](const std::string& reason) {
        // Only the failure that closed the sink is the cause; the rest are echoes
        if (sink.cancel(reason)) {
            std::lock_guard<std::mutex> lock(failure_mutex);
            failure = std::current_exception();
        }
    };

    auto work = [&] {
        try {
            LoadPipeline pipeline(mapper, csv, hook, sink);
            for (size_t i = next++; i < files.size() && !sink.cancelled(); i = next++) {
                size_t rows = pipeline.run(files[i]);
                logger.bulk(files[i] + ": " + std::to_string(rows) + " row(s)");
            }
        } catch (const std::exception& e) {
            record_failure(e.what());
        } catch (...) {
            record_failure("file worker failed");
        }
        sink.producer_done();
    };

    std::vector<std::thread> workers;
    workers.reserve(stats.workers);

    try {
        for (size_t w = 0; w < stats.workers; ++w) {
            workers.emplace_back(work);
        }
        sink.drain();
    } catch (const std::exception& e) {
        // drain() has already cancelled the sink when the writer failed
        sink.cancel(e.what());
        std::lock_guard<std::mutex> lock(failure_mutex);
        if (!failure) failure = std::current_exception();
    }

    for (auto& t : workers) {
        if (t.joinable()) t.join();
    }

    if (sink.cancelled()) {
        if (failure) std::rethrow_exception(failure);
        throw IoError(sink.cancel_reason());
    }

    stats.rows = sink.rows_written();
    return stats;
}

} // namespace PgBulk
