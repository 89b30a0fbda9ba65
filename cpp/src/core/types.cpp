/**
 * @file types.cpp
 * @brief Out-of-line helpers for the core value types
 */

#include "tkgstats/core/types.hpp"
#include <iomanip>
#include <sstream>

namespace tkgstats {

// ============================================================================
// Date
// ============================================================================

std::string Date::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << year << "-"
        << std::setw(2) << month << "-"
        << std::setw(2) << day;
    return oss.str();
}

bool Date::is_valid(int year, int month, int day) {
    static constexpr int kDaysInMonth[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1) {
        return false;
    }

    int limit = kDaysInMonth[month - 1];
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        if (leap) {
            limit = 29;
        }
    }
    return day <= limit;
}

// ============================================================================
// Stats / Summary equality
// ============================================================================

bool Stats::operator==(const Stats& other) const {
    return triples == other.triples &&
           temporal_records == other.temporal_records &&
           subjects == other.subjects &&
           objects == other.objects &&
           relations == other.relations &&
           subject_freq == other.subject_freq &&
           object_freq == other.object_freq &&
           entity_freq == other.entity_freq &&
           relation_freq == other.relation_freq &&
           year_freq == other.year_freq &&
           marker_freq == other.marker_freq &&
           min_date == other.min_date &&
           max_date == other.max_date &&
           min_year == other.min_year &&
           max_year == other.max_year;
}

bool Summary::operator==(const Summary& other) const {
    return triples == other.triples &&
           unique_subjects == other.unique_subjects &&
           unique_objects == other.unique_objects &&
           unique_relations == other.unique_relations &&
           top_entities == other.top_entities &&
           top_subjects == other.top_subjects &&
           top_objects == other.top_objects &&
           top_relations == other.top_relations &&
           top_years == other.top_years &&
           temporal_markers == other.temporal_markers &&
           temporal_records == other.temporal_records &&
           min_date == other.min_date &&
           max_date == other.max_date &&
           min_year == other.min_year &&
           max_year == other.max_year;
}

} // namespace tkgstats
