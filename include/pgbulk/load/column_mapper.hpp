/**
 * @file column_mapper.hpp
 * @brief Fans one input record out to the staging columns of every table
 */

#pragma once

#include <pgbulk/io/csv_writer.hpp>
#include <pgbulk/io/record.hpp>
#include <pgbulk/load/job_config.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace PgBulk {

/**
 * @brief Precomputed input-field -> staging-column routing.
 *
 * Staging columns are numbered in table declaration order, then column order.
 * An input field feeds the first column, scanning tables in order, whose
 * source key equals the field name; later tables never see it. Reference
 * columns then copy the referenced input field verbatim from the original
 * record.
 *
 * Built once per job; map_into() does only hash lookups and pointer writes.
 */
class ColumnMapper {
public:
    /**
     * @throws ConfigurationError if a reference cannot be resolved
     */
    explicit ColumnMapper(const TableSpecs& tables);

    /**
     * @brief Route @p source into @p out (resized to column_count()).
     *
     * Pointers in @p out alias values of @p source and stay valid only while
     * @p source is alive and unmodified.
     */
    void map_into(const Record& source, StagingRow& out) const;

    /**
     * @brief Keyed form of map_into(): staging column name -> value.
     *        Columns with no value are omitted.
     */
    Record map(const Record& source) const;

    const std::vector<std::string>& staging_columns() const { return staging_columns_; }
    size_t column_count() const { return staging_columns_.size(); }

private:
    struct Reference {
        size_t target;
        std::string source_key;
    };

    std::vector<std::string> staging_columns_;
    std::unordered_map<std::string, size_t> direct_;
    std::vector<Reference> references_;
};

} // namespace PgBulk
