#pragma once

#include <string>
#include <string_view>

namespace tkgstats {

/// Column convention used by a dataset to encode temporal validity
enum class DatasetType {
    EVENT_CALENDAR,     ///< ICEWS style: column 4 is a YYYY-MM-DD date
    LINKED_DATA,        ///< Wikidata style: column 4 marker, column 5 year
    FACT_EXTRACTION,    ///< YAGO style: column 4 <marker>, column 5 "date"
    GENERIC             ///< No known convention, no temporal extraction
};

/// Classify a dataset directory name by case-insensitive substring match.
/// Priority: "icews", then "wikidata", then "yago"; anything else is GENERIC.
DatasetType classify_dataset(std::string_view dataset_name);

/// Stable lowercase name ("event_calendar", "linked_data", ...)
const char* dataset_type_name(DatasetType type);

} // namespace tkgstats
