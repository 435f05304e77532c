#pragma once

#include <string>
#include <vector>

namespace PgBulk {

/**
 * @brief Absolute paths of regular files under @p directory matching the
 *        shell glob @p pattern, sorted.
 * @throws ConfigurationError if @p directory does not exist
 */
std::vector<std::string> discover_files(const std::string& directory, const std::string& pattern = "*");

} // namespace PgBulk
