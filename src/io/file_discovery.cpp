#include <pgbulk/io/file_discovery.hpp>
#include <pgbulk/errors.hpp>
#include <filesystem>
#include <glob.h>

namespace fs = std::filesystem;

namespace PgBulk {

namespace {

// glob(3) would expand metacharacters in the directory part too
std::string escape_glob(const std::string& literal) {
    std::string out;
    out.reserve(literal.size());
    for (char c : literal) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

} // namespace

std::vector<std::string> discover_files(const std::string& directory, const std::string& pattern) {
    std::error_code ec;
    fs::path base = fs::absolute(directory, ec);
    if (ec || !fs::is_directory(base, ec)) {
        throw ConfigurationError("directory not found: " + directory);
    }
    base = base.lexically_normal();

    std::string expr = escape_glob(base.string());
    if (expr.empty() || expr.back() != '/') expr.push_back('/');
    expr += pattern.empty() ? "*" : pattern;

    glob_t matches{};
    int rc = ::glob(expr.c_str(), 0, nullptr, &matches);
    if (rc != 0 && rc != GLOB_NOMATCH) {
        globfree(&matches);
        throw IoError("cannot list " + base.string() + " (glob error " + std::to_string(rc) + ")");
    }

    std::vector<std::string> files;
    for (size_t i = 0; i < matches.gl_pathc; ++i) {
        fs::path p(matches.gl_pathv[i]);
        if (fs::is_regular_file(p, ec)) {
            files.push_back(p.string());
        }
    }
    globfree(&matches);

    return files;
}

} // namespace PgBulk
