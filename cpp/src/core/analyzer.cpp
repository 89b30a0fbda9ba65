/**
 * @file analyzer.cpp
 * @brief Implementation of the dataset orchestrator
 */

#include "tkgstats/core/analyzer.hpp"
#include "tkgstats/core/errors.hpp"
#include "tkgstats/processing/triple_stats_accumulator.hpp"
#include "tkgstats/statistics/stats_merger.hpp"
#include "tkgstats/statistics/summarizer.hpp"
#include <iostream>
#include <utility>

namespace tkgstats {

// ============================================================================
// Construction
// ============================================================================

Analyzer::Analyzer(AnalyzeOptions options)
    : options_(std::move(options))
{
}

// ============================================================================
// Public API
// ============================================================================

AnalysisResult Analyzer::run() const {
    AnalysisResult results;

    for (const auto& entry : select_datasets()) {
        DatasetReport report;
        Stats aggregate = analyze_dataset(entry, options_.per_file ? &report.files : nullptr);
        report.aggregate = Summarizer::summarize(aggregate, options_.top_n);
        results.emplace(entry.name, std::move(report));
    }

    return results;
}

std::map<std::string, Stats> Analyzer::collect_dataset_stats() const {
    std::map<std::string, Stats> results;

    for (const auto& entry : select_datasets()) {
        results.emplace(entry.name, analyze_dataset(entry));
    }

    return results;
}

Stats Analyzer::analyze_dataset(
    const DatasetEntry& entry,
    std::map<std::string, Summary>* file_summaries
) const {
    auto files = DatasetSource::list_split_files(entry.directory, options_.extension);

    if (options_.verbose) {
        std::cerr << "[TKG] Analyzing " << entry.name
                  << " (" << dataset_type_name(entry.type) << ", "
                  << files.size() << " files)" << std::endl;
    }

    Stats aggregate;
    for (const auto& path : files) {
        Stats file_stats = TripleStatsAccumulator::process_file(path, entry.type);

        if (options_.verbose) {
            std::cerr << "[TKG]   " << path.filename().string() << ": "
                      << file_stats.triples << " triples" << std::endl;
        }

        if (file_summaries) {
            (*file_summaries)[path.filename().string()] =
                Summarizer::summarize(file_stats, options_.top_n);
        }

        // file_stats is final from here on; the aggregate is a new value
        aggregate = StatsMerger::merge(std::move(aggregate), file_stats);
    }

    return aggregate;
}

std::vector<DatasetEntry> Analyzer::select_datasets() const {
    auto names = DatasetSource::discover_datasets(options_.base_dir, options_.datasets);
    if (names.empty()) {
        throw ConfigurationError(
            "No dataset folders found under " + options_.base_dir.string() + ".");
    }

    std::vector<DatasetEntry> entries;
    entries.reserve(names.size());
    for (const auto& name : names) {
        entries.push_back(DatasetSource::make_entry(options_.base_dir, name));
    }
    return entries;
}

} // namespace tkgstats
