/**
 * @file csv_writer.hpp
 * @brief Serializes staging rows for COPY ... (FORMAT CSV)
 */

#pragma once

#include <string>
#include <vector>

namespace PgBulk {

// Positional row; nullptr means no value (NULL on the server).
using StagingRow = std::vector<const std::string*>;

/**
 * @brief Appends rows in PostgreSQL's CSV COPY dialect.
 *
 * Absent and empty values become an unquoted empty field, which COPY reads as
 * NULL. Values holding the separator, the quote, CR/LF or the end-of-data
 * marker are quoted with doubled inner quotes.
 */
class CsvWriter {
public:
    explicit CsvWriter(char separator = ',', char quote = '"') noexcept
        : separator_(separator), quote_(quote) {}

    void append_row(std::string& out, const StagingRow& row) const;
    void append_field(std::string& out, const std::string* value) const;

    bool needs_quoting(const std::string& value) const;

private:
    char separator_;
    char quote_;
};

} // namespace PgBulk
