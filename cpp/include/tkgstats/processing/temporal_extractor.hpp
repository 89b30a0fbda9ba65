#pragma once

/**
 * @file temporal_extractor.hpp
 * @brief Per-convention extraction of temporal fields from a triple row
 *
 * This is the only place that knows which trailing column holds what for
 * each DatasetType. Callers hand over the full column list of an accepted
 * row and get back a structured, possibly empty, contribution.
 */

#include "tkgstats/core/types.hpp"
#include "tkgstats/data/dataset_type.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tkgstats {

/// Temporal contribution of one row
struct TemporalFields {
    std::optional<std::string> marker;  ///< Temporal marker (LINKED_DATA / FACT_EXTRACTION)
    std::optional<int64_t> year;        ///< Parsed year, if any
    std::optional<Date> date;           ///< Full date (EVENT_CALENDAR only)

    /// A row counts as a temporal record exactly when it carries a marker
    bool is_temporal_record() const { return marker.has_value(); }

    /// True when the row contributes nothing temporal
    bool empty() const { return !marker && !year && !date; }
};

/// Temporal field extractor (stateless)
class TemporalExtractor {
public:
    TemporalExtractor() = delete;  // Static class, no instances

    /// Extract the temporal contribution of a row.
    /// Malformed or missing trailing columns yield an empty (or partial)
    /// result, never an exception.
    static TemporalFields extract(const std::vector<std::string_view>& columns,
                                  DatasetType type);

    /// Parse a YYYY-MM-DD date (4-digit year, 1-2 digit month and day, the
    /// whole token consumed, the day must exist)
    static std::optional<Date> parse_date(std::string_view token);

    /// Parse an integer year token: optional sign followed by digits,
    /// nothing else
    static std::optional<int64_t> parse_year(std::string_view token);

    /// Year from the leading run of digits of `token`, when the run has at
    /// least 4 digits (the first 4 are used)
    static std::optional<int64_t> leading_digits_year(std::string_view token);

    /// Strip any of `chars` from both ends of `text`
    static std::string_view strip_chars(std::string_view text, std::string_view chars);

private:
    static TemporalFields extract_event_calendar(const std::vector<std::string_view>& columns);
    static TemporalFields extract_linked_data(const std::vector<std::string_view>& columns);
    static TemporalFields extract_fact_extraction(const std::vector<std::string_view>& columns);
};

} // namespace tkgstats
