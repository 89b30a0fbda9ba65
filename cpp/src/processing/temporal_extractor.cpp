#include "tkgstats/processing/temporal_extractor.hpp"
#include "tkgstats/data/triple_reader.hpp"
#include <charconv>

namespace tkgstats {

namespace {

// Zero-based indices of the trailing temporal columns
constexpr size_t kDateColumn = 3;
constexpr size_t kMarkerColumn = 3;
constexpr size_t kYearColumn = 4;

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

/// Parse an all-digit field of `min_len`..`max_len` characters
std::optional<int> parse_digits(std::string_view field, size_t min_len, size_t max_len) {
    if (field.size() < min_len || field.size() > max_len) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : field) {
        if (!is_digit(c)) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

} // namespace

// ===== Public API =====

TemporalFields TemporalExtractor::extract(const std::vector<std::string_view>& columns,
                                          DatasetType type) {
    switch (type) {
        case DatasetType::EVENT_CALENDAR:
            return extract_event_calendar(columns);
        case DatasetType::LINKED_DATA:
            return extract_linked_data(columns);
        case DatasetType::FACT_EXTRACTION:
            return extract_fact_extraction(columns);
        case DatasetType::GENERIC:
            // No column convention is known for unclassified datasets
            return TemporalFields();
    }
    return TemporalFields();
}

std::optional<Date> TemporalExtractor::parse_date(std::string_view token) {
    size_t first_dash = token.find('-');
    if (first_dash == std::string_view::npos) {
        return std::nullopt;
    }
    size_t second_dash = token.find('-', first_dash + 1);
    if (second_dash == std::string_view::npos) {
        return std::nullopt;
    }

    auto year = parse_digits(token.substr(0, first_dash), 4, 4);
    auto month = parse_digits(token.substr(first_dash + 1, second_dash - first_dash - 1), 1, 2);
    auto day = parse_digits(token.substr(second_dash + 1), 1, 2);
    if (!year || !month || !day) {
        return std::nullopt;
    }

    if (!Date::is_valid(*year, *month, *day)) {
        return std::nullopt;
    }
    return Date(*year, *month, *day);
}

std::optional<int64_t> TemporalExtractor::parse_year(std::string_view token) {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
        // "+-5" is not a number
        if (!token.empty() && token.front() == '-') {
            return std::nullopt;
        }
    }
    if (token.empty()) {
        return std::nullopt;
    }

    int64_t value = 0;
    const char* begin = token.data();
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<int64_t> TemporalExtractor::leading_digits_year(std::string_view token) {
    size_t run = 0;
    while (run < token.size() && is_digit(token[run])) {
        ++run;
    }
    if (run < 4) {
        return std::nullopt;
    }

    int64_t year = 0;
    for (size_t i = 0; i < 4; ++i) {
        year = year * 10 + (token[i] - '0');
    }
    return year;
}

std::string_view TemporalExtractor::strip_chars(std::string_view text, std::string_view chars) {
    size_t first = text.find_first_not_of(chars);
    if (first == std::string_view::npos) {
        return {};
    }
    size_t last = text.find_last_not_of(chars);
    return text.substr(first, last - first + 1);
}

// ===== Per-convention extraction =====

TemporalFields TemporalExtractor::extract_event_calendar(const std::vector<std::string_view>& columns) {
    TemporalFields fields;
    if (columns.size() < 4) {
        return fields;
    }

    auto date = parse_date(columns[kDateColumn]);
    if (!date) {
        return fields;
    }

    fields.year = date->year;
    fields.date = *date;
    return fields;
}

TemporalFields TemporalExtractor::extract_linked_data(const std::vector<std::string_view>& columns) {
    TemporalFields fields;
    if (columns.size() < 5) {
        return fields;
    }

    // The marker counts even when the year is missing or malformed
    fields.marker = std::string(columns[kMarkerColumn]);

    std::string_view year_token = TripleReader::trim(columns[kYearColumn]);
    if (!year_token.empty()) {
        fields.year = parse_year(year_token);
    }
    return fields;
}

TemporalFields TemporalExtractor::extract_fact_extraction(const std::vector<std::string_view>& columns) {
    TemporalFields fields;
    if (columns.size() < 5) {
        return fields;
    }

    fields.marker = std::string(strip_chars(columns[kMarkerColumn], "<>\""));

    std::string_view date_token = strip_chars(columns[kYearColumn], "\"");
    fields.year = leading_digits_year(date_token);
    return fields;
}

} // namespace tkgstats
