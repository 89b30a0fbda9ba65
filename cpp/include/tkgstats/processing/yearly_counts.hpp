#pragma once

/**
 * @file yearly_counts.hpp
 * @brief Per-year triple counts of a dataset, exported as an Arrow table
 *
 * Years come from TemporalExtractor, so every convention uses the same
 * rules as the statistics report; GENERIC datasets have no years.
 */

#include "tkgstats/core/types.hpp"
#include "tkgstats/data/dataset_type.hpp"
#include <arrow/api.h>
#include <filesystem>
#include <memory>
#include <string>

namespace tkgstats {

class YearlyCounts {
public:
    YearlyCounts() = delete;  // Static class, no instances

    /// Year -> triple count over every split of `dataset_dir`
    static FrequencyCounter<int64_t> count_years(const std::filesystem::path& dataset_dir,
                                                 DatasetType type,
                                                 const std::string& extension);

    /// Table with int64 columns "year" and "triples", sorted by year
    static std::shared_ptr<arrow::Table> make_year_table(const FrequencyCounter<int64_t>& counts);

    /// Write a table as CSV (header row included). Throws IoError.
    static void write_csv(const arrow::Table& table, const std::filesystem::path& path);

    /// "<output_dir>/<dataset>_yearly_counts.csv"
    static std::filesystem::path output_path(const std::filesystem::path& output_dir,
                                             const std::string& dataset);
};

} // namespace tkgstats
