#include "tkgstats/data/dataset_type.hpp"
#include <algorithm>
#include <cctype>

namespace tkgstats {

namespace {

struct ConventionRule {
    const char* needle;
    DatasetType type;
};

// Checked in order, first match wins
constexpr ConventionRule kConventions[] = {
    {"icews", DatasetType::EVENT_CALENDAR},
    {"wikidata", DatasetType::LINKED_DATA},
    {"yago", DatasetType::FACT_EXTRACTION},
};

std::string to_lower_ascii(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

} // namespace

DatasetType classify_dataset(std::string_view dataset_name) {
    const std::string name = to_lower_ascii(dataset_name);
    for (const auto& rule : kConventions) {
        if (name.find(rule.needle) != std::string::npos) {
            return rule.type;
        }
    }
    return DatasetType::GENERIC;
}

const char* dataset_type_name(DatasetType type) {
    switch (type) {
        case DatasetType::EVENT_CALENDAR:  return "event_calendar";
        case DatasetType::LINKED_DATA:     return "linked_data";
        case DatasetType::FACT_EXTRACTION: return "fact_extraction";
        case DatasetType::GENERIC:         return "generic";
    }
    return "generic";
}

} // namespace tkgstats
