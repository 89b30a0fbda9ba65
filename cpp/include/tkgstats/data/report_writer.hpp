#pragma once

#include "tkgstats/core/types.hpp"
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace tkgstats {

/// Text and JSON projections of analysis results (no logic of their own)
class ReportWriter {
public:
    ReportWriter() = delete;  // Static class, no instances

    /// Labeled lines of one summary, headed by "=== <name> ===".
    /// Lines whose list or value is empty are left out.
    static std::vector<std::string> humanize(const std::string& name, const Summary& summary);

    /// Full console report: every aggregate block, then (with `per_file`)
    /// the indented block of each split, then a blank line
    static void write_text(std::ostream& out, const AnalysisResult& result, bool per_file);

    /// JSON object of one summary, keys in Summary field order
    static nlohmann::ordered_json summary_to_json(const Summary& summary);

    /// JSON document: {dataset: {"aggregate": ..., "files": {...}}}
    static nlohmann::ordered_json to_json(const AnalysisResult& result);

    /// Serialize with a 2-space indent (non-ASCII escaped)
    static std::string dump(const nlohmann::ordered_json& doc);

    /// Write the JSON document to `path` (throws IoError)
    static void write_json(const std::filesystem::path& path, const AnalysisResult& result);

    /// Decimal with ',' thousands grouping (1234567 -> "1,234,567")
    static std::string format_count(uint64_t value);
};

} // namespace tkgstats
