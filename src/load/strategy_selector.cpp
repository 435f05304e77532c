#include <pgbulk/load/strategy_selector.hpp>

namespace PgBulk {

bool requires_staging(const JobConfig& config) {
    if (config.force_staging || config.tables.size() > 1) return true;

    for (const auto& table : config.tables) {
        for (const auto& col : table.columns) {
            if (col.expand || col.cast_type) return true;
        }
    }
    return false;
}

} // namespace PgBulk
