#pragma once

#include <string>
#include <unordered_map>

namespace PgBulk {

// One parsed input line: column name -> raw text value.
using Record = std::unordered_map<std::string, std::string>;

} // namespace PgBulk
