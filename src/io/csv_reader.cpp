#include <pgbulk/io/csv_reader.hpp>
#include <pgbulk/errors.hpp>

namespace PgBulk {

CsvReader::CsvReader(const std::string& path, CsvOptions options)
    : file_(std::make_unique<std::ifstream>(path, std::ios::binary)),
      in_(file_.get()),
      options_(std::move(options)),
      source_(path) {
    if (!file_->is_open()) {
        throw IoError("cannot open " + path);
    }
}

CsvReader::CsvReader(std::istream& in, CsvOptions options, std::string source_name)
    : in_(&in), options_(std::move(options)), source_(std::move(source_name)) {}

void CsvReader::skip_bom() {
    static const char bom[] = {'\xEF', '\xBB', '\xBF'};
    if (in_->peek() != static_cast<unsigned char>(bom[0])) return;

    char head[3] = {0, 0, 0};
    in_->read(head, 3);
    if (in_->gcount() == 3 && head[0] == bom[0] && head[1] == bom[1] && head[2] == bom[2]) return;

    // Not a BOM, just a multi-byte first character
    in_->clear();
    in_->seekg(0);
}

void CsvReader::start() {
    started_ = true;
    skip_bom();

    std::vector<std::string> skipped;
    for (size_t i = 0; i < options_.skip_lines; ++i) {
        if (!read_fields(skipped)) return;
    }

    if (!options_.headers.empty()) {
        headers_ = options_.headers;
        return;
    }

    if (!read_nonblank(headers_)) return;
    for (size_t i = 0; i < headers_.size(); ++i) {
        if (headers_[i].empty()) {
            throw IoError(source_ + ":" + std::to_string(record_line_) +
                          ": empty header name in column " + std::to_string(i + 1));
        }
    }
}

bool CsvReader::read_fields(std::vector<std::string>& fields) {
    fields.clear();
    record_line_ = line_;

    std::streambuf* buf = in_->rdbuf();
    const char quote = options_.quote;
    const char separator = options_.separator;

    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;
    bool any = false;

    while (true) {
        int c = buf->sbumpc();
        if (c == std::char_traits<char>::eof()) {
            if (in_quotes) {
                throw IoError(source_ + ":" + std::to_string(record_line_) + ": unterminated quoted field");
            }
            if (!any) return false;
            fields.push_back(std::move(field));
            return true;
        }
        any = true;
        char ch = static_cast<char>(c);

        if (in_quotes) {
            if (ch == quote) {
                if (buf->sgetc() == static_cast<unsigned char>(quote)) {
                    buf->sbumpc();
                    field.push_back(quote);
                } else {
                    in_quotes = false;
                }
            } else {
                if (ch == '\n') ++line_;
                field.push_back(ch);
            }
            continue;
        }

        if (ch == quote && field.empty() && !field_quoted) {
            in_quotes = true;
            field_quoted = true;
        } else if (ch == separator) {
            fields.push_back(std::move(field));
            field.clear();
            field_quoted = false;
        } else if (ch == '\n' || ch == '\r') {
            if (ch == '\r' && buf->sgetc() == '\n') buf->sbumpc();
            ++line_;
            fields.push_back(std::move(field));
            return true;
        } else if (field_quoted) {
            throw IoError(source_ + ":" + std::to_string(line_) + ": unexpected character after closing quote");
        } else {
            field.push_back(ch);
        }
    }
}

bool CsvReader::read_nonblank(std::vector<std::string>& fields) {
    while (read_fields(fields)) {
        if (fields.size() == 1 && fields[0].empty()) continue;
        return true;
    }
    return false;
}

bool CsvReader::next(Record& record) {
    if (!started_) start();

    record.clear();
    if (headers_.empty() || !read_nonblank(fields_)) return false;

    if (fields_.size() > headers_.size()) {
        throw IoError(source_ + ":" + std::to_string(record_line_) + ": row has " +
                      std::to_string(fields_.size()) + " fields, header has " +
                      std::to_string(headers_.size()));
    }

    for (size_t i = 0; i < fields_.size(); ++i) {
        record.emplace(headers_[i], std::move(fields_[i]));
    }
    return true;
}

} // namespace PgBulk
