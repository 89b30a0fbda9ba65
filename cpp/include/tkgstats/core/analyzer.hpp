#pragma once

/**
 * @file analyzer.hpp
 * @brief Dataset-level orchestration of the statistics engine
 *
 * Analyzer is the main entry point of the engine. For every selected
 * dataset directory it classifies the convention once, streams each split
 * file through TripleStatsAccumulator, folds the per-file Stats with
 * StatsMerger and summarizes the result.
 *
 * Processing is sequential and fail-fast: the first error aborts the run
 * and no partial result is returned.
 *
 * Usage:
 * @code
 *   AnalyzeOptions opts;
 *   opts.base_dir = "TemporalKGs";
 *   opts.datasets = {"icews14"};
 *   opts.per_file = true;
 *
 *   AnalysisResult result = Analyzer(opts).run();
 *   ReportWriter::write_text(std::cout, result, opts.per_file);
 * @endcode
 */

#include "tkgstats/core/types.hpp"
#include "tkgstats/sources/dataset_source.hpp"
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace tkgstats {

namespace constants {
    /// Default folder holding the dataset subdirectories
    constexpr const char* DEFAULT_BASE_DIR = "TemporalKGs";

    /// Default ranking length
    constexpr size_t DEFAULT_TOP_N = 5;

    /// Extension of split files inside a dataset directory
    constexpr const char* SPLIT_EXTENSION = ".txt";
}

/// Analysis options
struct AnalyzeOptions {
    std::filesystem::path base_dir = constants::DEFAULT_BASE_DIR;  ///< Folder of dataset directories
    std::vector<std::string> datasets;      ///< Name filter, case-insensitive (empty = all)
    size_t top_n = constants::DEFAULT_TOP_N; ///< Ranking length
    bool per_file = false;                  ///< Also summarize every split
    std::string extension = constants::SPLIT_EXTENSION; ///< Split file extension
    bool verbose = false;                   ///< Log progress to stderr
};

/**
 * @brief Runs the engine over a base directory of datasets
 */
class Analyzer {
public:
    /// Constructor
    explicit Analyzer(AnalyzeOptions options);

    /**
     * @brief Analyze every selected dataset
     *
     * @return Dataset name -> {aggregate summary, per-file summaries}
     * @throws ConfigurationError "No dataset folders found" when the
     *         selection is empty (checked before any file is read)
     * @throws IoError when a split file cannot be read
     */
    AnalysisResult run() const;

    /**
     * @brief Aggregate Stats of every selected dataset, unsummarized
     *
     * Same selection and failure rules as run().
     */
    std::map<std::string, Stats> collect_dataset_stats() const;

    /**
     * @brief Aggregate Stats of one dataset
     *
     * @param entry Dataset to process
     * @param file_summaries If non-null, receives one Summary per split
     */
    Stats analyze_dataset(
        const DatasetEntry& entry,
        std::map<std::string, Summary>* file_summaries = nullptr
    ) const;

    /**
     * @brief Resolve the dataset selection
     *
     * @throws ConfigurationError when nothing is selected
     */
    std::vector<DatasetEntry> select_datasets() const;

    /// Options in use
    const AnalyzeOptions& options() const { return options_; }

private:
    AnalyzeOptions options_;
};

} // namespace tkgstats
