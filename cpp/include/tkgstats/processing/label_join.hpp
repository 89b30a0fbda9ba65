#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace tkgstats {

/// Identifier -> human-readable label
using LabelMapping = std::unordered_map<std::string, std::string>;

/// Label join options
struct LabelJoinOptions {
    char delimiter = '\t';              ///< Column delimiter of both files
    std::string missing_value;          ///< Placeholder for unmapped identifiers
    std::filesystem::path output;       ///< Empty = "<dataset>.labeled"
};

/// Attaches subject/object labels to the rows of a split file
class LabelJoiner {
public:
    LabelJoiner() = delete;  // Static class, no instances

    /// Resolve a delimiter argument: a single character, or an escape such
    /// as "\t" (throws ConfigurationError otherwise)
    static char resolve_delimiter(const std::string& spec);

    /// Load a two-column identifier/label file.
    /// Rows with an empty identifier are skipped, a missing label column
    /// gives an empty label, later rows win. Throws IoError.
    static LabelMapping load_mapping(const std::filesystem::path& path, char delimiter);

    /// "<dataset>.labeled" next to the source file
    static std::filesystem::path default_output_path(const std::filesystem::path& dataset);

    /// Rewrite `dataset` with two label columns after the object column.
    /// Rows with fewer than 3 columns are copied unchanged.
    /// Returns the number of rows written. Throws IoError.
    static uint64_t attach_labels(const std::filesystem::path& dataset,
                                  const LabelMapping& mapping,
                                  const LabelJoinOptions& opts);
};

} // namespace tkgstats
