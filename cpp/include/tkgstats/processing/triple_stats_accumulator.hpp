#pragma once

#include "tkgstats/core/types.hpp"
#include "tkgstats/data/dataset_type.hpp"
#include "tkgstats/processing/temporal_extractor.hpp"
#include <filesystem>
#include <string_view>
#include <vector>

namespace tkgstats {

/// Builds the Stats of a single split file.
/// Owns its Stats exclusively until finish() hands it over.
class TripleStatsAccumulator {
public:
    /// Constructor
    explicit TripleStatsAccumulator(DatasetType type);

    /// Add one raw line. Blank lines and lines with fewer than 3 columns
    /// are ignored. Returns true when the line was counted as a triple.
    bool add_line(std::string_view line);

    /// Add an already split row (must have at least 3 columns).
    /// Returns false and counts nothing otherwise.
    bool add_columns(const std::vector<std::string_view>& columns);

    /// Statistics gathered so far
    const Stats& stats() const { return stats_; }

    /// Hand over the statistics (the accumulator is left empty)
    Stats finish();

    /// Dataset convention used for temporal extraction
    DatasetType type() const { return type_; }

    /// Stream a whole split file into a fresh Stats value
    static Stats process_file(const std::filesystem::path& path, DatasetType type);

private:
    /// Apply the temporal contribution of one row
    void apply_temporal(const TemporalFields& fields);

    DatasetType type_;
    Stats stats_;
    std::vector<std::string_view> scratch_;  ///< Reused split buffer for add_line
};

} // namespace tkgstats
