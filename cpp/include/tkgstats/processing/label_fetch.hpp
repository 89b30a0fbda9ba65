#pragma once

/**
 * @file label_fetch.hpp
 * @brief Builds an entity-label mapping from the Wikidata API
 *
 * Collects the Q-identifiers of a dataset's subject/object columns, asks
 * wbgetentities for their labels in batches and writes the two-column
 * file that LabelJoiner::load_mapping reads. Only the tools use this;
 * the statistics engine itself never touches the network.
 */

#include "tkgstats/processing/label_join.hpp"
#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tkgstats {

/// Label fetch options
struct LabelFetchOptions {
    std::string api_url = "https://www.wikidata.org/w/api.php";
    std::string language = "en";
    std::string user_agent = "TemporalKGLabelFetcher/1.0 (https://example.org/contact)";
    size_t batch_size = 50;             ///< wbgetentities accepts at most 50 ids
    double delay_seconds = 0.1;         ///< Pause between requests
    long timeout_ms = 30000;
};

class LabelFetcher {
public:
    LabelFetcher() = delete;  // Static class, no instances

    /// True for "Q" followed by one or more digits
    static bool is_entity_id(std::string_view token);

    /// Entity identifiers found in the subject/object columns of every
    /// split under `dataset_dir`. Throws IoError.
    static std::set<std::string> collect_entity_ids(const std::filesystem::path& dataset_dir,
                                                    const std::string& extension);

    /// Consecutive chunks of at most `size` ids (size 0 is treated as 1)
    static std::vector<std::vector<std::string>> batched(const std::set<std::string>& ids,
                                                         size_t size);

    /// wbgetentities query URL for one batch
    static std::string build_request_url(const std::vector<std::string>& ids,
                                         const LabelFetchOptions& opts);

    /// Labels from a wbgetentities JSON response. Every requested id gets an
    /// entry; ids without a label in `language` map to "".
    /// Throws std::runtime_error on malformed JSON.
    static LabelMapping parse_labels(const std::string& response,
                                     const std::vector<std::string>& ids,
                                     const std::string& language);

    /// One HTTP round trip for a batch (throws std::runtime_error on a
    /// transport failure or a non-200 status)
    static LabelMapping fetch_labels(const std::vector<std::string>& ids,
                                     const LabelFetchOptions& opts);

    /// Fetch every id batch by batch, reporting progress on stderr
    static LabelMapping build_mapping(const std::set<std::string>& ids,
                                      const LabelFetchOptions& opts);

    /// Write "id<TAB>label" rows sorted by id; creates the parent directory.
    /// Throws IoError.
    static void write_mapping(const std::filesystem::path& path, const LabelMapping& mapping);
};

} // namespace tkgstats
