#include <pgbulk/load/column_mapper.hpp>
#include <pgbulk/errors.hpp>

namespace PgBulk {

ColumnMapper::ColumnMapper(const TableSpecs& tables) {
    struct Located {
        size_t index;
        const ColumnSpec* spec;
    };
    std::vector<Located> all;

    for (const auto& table : tables) {
        for (const auto& col : table.columns) {
            size_t index = staging_columns_.size();
            staging_columns_.push_back(staging_column(table.name, col.destination));
            all.push_back({index, &col});

            // emplace keeps the first claimant: first table, then first column
            direct_.emplace(col.source_key(), index);
        }
    }

    for (const auto& located : all) {
        const ColumnSpec& col = *located.spec;
        if (!col.references) continue;

        const ColumnSpec* referenced = nullptr;
        for (const auto& candidate : all) {
            if (candidate.spec->source_key() == *col.references) {
                referenced = candidate.spec;
                break;
            }
        }
        if (!referenced) {
            throw ConfigurationError("column '" + staging_columns_[located.index] +
                                     "' references unknown column '" + *col.references + "'");
        }
        references_.push_back({located.index, referenced->source_key()});
    }
}

void ColumnMapper::map_into(const Record& source, StagingRow& out) const {
    out.assign(staging_columns_.size(), nullptr);

    for (const auto& [key, value] : source) {
        auto it = direct_.find(key);
        if (it != direct_.end()) {
            out[it->second] = &value;
        }
    }

    for (const auto& ref : references_) {
        auto it = source.find(ref.source_key);
        out[ref.target] = it != source.end() ? &it->second : nullptr;
    }
}

Record ColumnMapper::map(const Record& source) const {
    StagingRow row;
    map_into(source, row);

    Record staged;
    for (size_t i = 0; i < row.size(); ++i) {
        if (row[i]) staged.emplace(staging_columns_[i], *row[i]);
    }
    return staged;
}

} // namespace PgBulk
