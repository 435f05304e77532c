#include <pgbulk/io/csv_writer.hpp>

namespace PgBulk {

bool CsvWriter::needs_quoting(const std::string& value) const {
    if (value == "\\.") return true;
    for (char c : value) {
        if (c == separator_ || c == quote_ || c == '\n' || c == '\r') return true;
    }
    return false;
}

void CsvWriter::append_field(std::string& out, const std::string* value) const {
    if (!value || value->empty()) return;

    if (!needs_quoting(*value)) {
        out.append(*value);
        return;
    }

    out.push_back(quote_);
    for (char c : *value) {
        if (c == quote_) out.push_back(quote_);
        out.push_back(c);
    }
    out.push_back(quote_);
}

void CsvWriter::append_row(std::string& out, const StagingRow& row) const {
    for (size_t i = 0; i < row.size(); ++i) {
        if (i) out.push_back(separator_);
        append_field(out, row[i]);
    }
    out.push_back('\n');
}

} // namespace PgBulk
