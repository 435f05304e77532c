/**
 * @file csv_reader.hpp
 * @brief Streaming delimited-text reader producing Records
 */

#pragma once

#include <pgbulk/io/record.hpp>
#include <cstddef>
#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace PgBulk {

/**
 * @brief How input files are split into fields and named.
 *
 * With no headers the first (non-skipped) line of every file names the
 * fields; otherwise every line is data and fields are named by position.
 */
struct CsvOptions {
    std::vector<std::string> headers;
    char separator = ',';
    char quote = '"';
    size_t skip_lines = 0;
};

/**
 * @brief Reads one record at a time; memory use is bounded by the longest row.
 *
 * Quoted fields may contain separators, newlines and doubled quotes. Blank
 * lines are skipped and a leading UTF-8 BOM is ignored.
 */
class CsvReader {
public:
    /**
     * @throws IoError if the file cannot be opened
     */
    CsvReader(const std::string& path, CsvOptions options);

    /**
     * @brief Read from an existing stream; @p source_name is used in errors.
     */
    CsvReader(std::istream& in, CsvOptions options, std::string source_name = "<stream>");

    /**
     * @brief Fill @p record with the next row.
     * @return false at end of input
     * @throws IoError on malformed input
     */
    bool next(Record& record);

    const std::vector<std::string>& headers() const { return headers_; }

    /**
     * @brief 1-based line on which the last returned record started.
     */
    size_t record_line() const { return record_line_; }

private:
    void start();
    bool read_fields(std::vector<std::string>& fields);
    bool read_nonblank(std::vector<std::string>& fields);
    void skip_bom();

    std::unique_ptr<std::ifstream> file_;
    std::istream* in_;
    CsvOptions options_;
    std::string source_;

    std::vector<std::string> headers_;
    std::vector<std::string> fields_;
    size_t line_ = 1;
    size_t record_line_ = 0;
    bool started_ = false;
};

} // namespace PgBulk
