/**
 * @file load_pipeline.hpp
 * @brief read -> parse -> hook -> map -> serialize -> sink, for one file
 */

#pragma once

#include <pgbulk/database/copy_sink.hpp>
#include <pgbulk/io/csv_reader.hpp>
#include <pgbulk/io/csv_writer.hpp>
#include <pgbulk/io/record.hpp>
#include <pgbulk/load/column_mapper.hpp>
#include <pgbulk/utils/logger.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace PgBulk {

/**
 * @brief Per-row user hook. Returns the record to load (same or replaced).
 *        May block; it runs on the file's own worker thread.
 */
using ParseHook = std::function<Record(Record)>;

/**
 * @brief Streams one file into a shared CopySink, preserving row order.
 *
 * Rows are grouped into chunks of whole rows before being handed to the
 * sink, so a full sink stalls the reader. Any failure (unreadable file,
 * malformed row, throwing hook) is raised as IoError naming the file.
 */
class LoadPipeline {
public:
    static constexpr size_t CHUNK_ROWS = 512;
    static constexpr size_t CHUNK_BYTES = 64 * 1024;

    LoadPipeline(const ColumnMapper& mapper, const CsvOptions& csv, const ParseHook& hook, CopySink& sink) noexcept;

    /**
     * @return Number of rows handed to the sink
     */
    size_t run(const std::string& path);

private:
    const ColumnMapper& mapper_;
    const CsvOptions& csv_;
    const ParseHook& hook_;
    CopySink& sink_;
    CsvWriter writer_;
};

/**
 * @brief Number of file workers for @p files files: @p max_workers, or the
 *        hardware thread count when 0, never more than the file count.
 */
size_t worker_count(size_t files, size_t max_workers);

struct StreamStats {
    size_t workers = 0;
    size_t rows = 0;
};

/**
 * @brief Stream every file into @p writer through one CopySink.
 *
 * At most worker_count() pipelines run at once, each taking the next
 * unclaimed path when its current file is done, so open files and threads
 * stay bounded however many files there are. @p writer runs only on the
 * calling thread. The first failure cancels the sink and is rethrown once
 * every worker has stopped.
 */
StreamStats stream_files(const std::vector<std::string>& files, size_t max_workers,
                         const ColumnMapper& mapper, const CsvOptions& csv, const ParseHook& hook,
                         CopySink::ChunkWriter writer, Logger& logger);

} // namespace PgBulk
