#pragma once

/**
 * @file types.hpp
 * @brief Core value types for the tkgstats engine
 *
 * This file defines the data structures shared by the accumulator, the
 * merger, the summarizer and the report writers: calendar dates,
 * insertion-ordered frequency counters, per-file/per-dataset statistics
 * and the derived read-only summaries.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <numeric>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tkgstats {

// ============================================================================
// Dates
// ============================================================================

/**
 * @brief Calendar date (proleptic Gregorian)
 *
 * Only produced by the extractor after validation, so every instance
 * outside of tests denotes an existing day.
 */
struct Date {
    int year;
    int month;
    int day;

    /// Default constructor (0001-01-01)
    Date() : year(1), month(1), day(1) {}

    /// Constructor
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    /// Equality comparison
    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }

    bool operator!=(const Date& other) const { return !(*this == other); }

    /// Chronological ordering
    bool operator<(const Date& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }

    bool operator>(const Date& other) const { return other < *this; }

    /// ISO 8601 rendering (YYYY-MM-DD)
    std::string to_string() const;

    /// Check that month/day denote an existing day of that year
    static bool is_valid(int year, int month, int day);
};

// ============================================================================
// Frequency counting
// ============================================================================

/**
 * @brief Counter that remembers first-insertion order of its keys
 *
 * Ranking ties are broken by that order, which keeps top-N output stable
 * instead of depending on hash iteration order.
 */
template<typename Key>
class FrequencyCounter {
public:
    using Entry = std::pair<Key, uint64_t>;

    /// Add `count` occurrences of `key`
    void add(const Key& key, uint64_t count = 1) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            index_.emplace(key, entries_.size());
            entries_.emplace_back(key, count);
        } else {
            entries_[it->second].second += count;
        }
    }

    /// Occurrences of `key` (0 when never seen)
    uint64_t get(const Key& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? 0 : entries_[it->second].second;
    }

    /// Number of distinct keys
    size_t size() const { return entries_.size(); }

    bool empty() const { return entries_.empty(); }

    /// All entries in first-seen order
    const std::vector<Entry>& entries() const { return entries_; }

    /// Sum of all counts
    uint64_t total() const {
        uint64_t sum = 0;
        for (const auto& entry : entries_) {
            sum += entry.second;
        }
        return sum;
    }

    /// Up to `n` entries by descending count, ties in first-seen order
    std::vector<Entry> most_common(size_t n) const {
        std::vector<size_t> order(entries_.size());
        std::iota(order.begin(), order.end(), size_t{0});
        std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b) {
            return entries_[a].second > entries_[b].second;
        });

        order.resize(std::min(n, order.size()));

        std::vector<Entry> result;
        result.reserve(order.size());
        for (size_t idx : order) {
            result.push_back(entries_[idx]);
        }
        return result;
    }

    /// Content equality (insertion order is not compared)
    bool operator==(const FrequencyCounter& other) const {
        if (entries_.size() != other.entries_.size()) {
            return false;
        }
        for (const auto& entry : entries_) {
            if (other.get(entry.first) != entry.second) {
                return false;
            }
        }
        return true;
    }

    bool operator!=(const FrequencyCounter& other) const { return !(*this == other); }

private:
    std::unordered_map<Key, size_t> index_;  ///< key -> position in entries_
    std::vector<Entry> entries_;             ///< first-seen order
};

/// Top-N ranking: (key, count) pairs by descending count
template<typename Key>
using Ranking = std::vector<std::pair<Key, uint64_t>>;

// ============================================================================
// Statistics
// ============================================================================

/// One (subject, relation, object) record
struct Triple {
    std::string subject;
    std::string relation;
    std::string object;

    bool operator==(const Triple& other) const {
        return subject == other.subject && relation == other.relation &&
               object == other.object;
    }
};

/**
 * @brief Running statistics for one split file or one dataset aggregate
 *
 * Mutated only by the accumulator reading its file; after that it is
 * treated as an immutable value and folded by StatsMerger.
 */
struct Stats {
    uint64_t triples = 0;                            ///< Accepted lines

    std::unordered_set<std::string> subjects;        ///< Unique subjects
    std::unordered_set<std::string> objects;         ///< Unique objects
    std::unordered_set<std::string> relations;       ///< Unique relations

    FrequencyCounter<std::string> subject_freq;
    FrequencyCounter<std::string> object_freq;
    FrequencyCounter<std::string> entity_freq;       ///< Subject + object occurrences
    FrequencyCounter<std::string> relation_freq;
    FrequencyCounter<int64_t> year_freq;
    FrequencyCounter<std::string> marker_freq;

    uint64_t temporal_records = 0;                   ///< Lines carrying a temporal marker

    std::optional<Date> min_date;
    std::optional<Date> max_date;
    std::optional<int64_t> min_year;
    std::optional<int64_t> max_year;

    /// Content equality over every field
    bool operator==(const Stats& other) const;
    bool operator!=(const Stats& other) const { return !(*this == other); }
};

/**
 * @brief Read-only report derived from a Stats value
 *
 * Field order is the order of the JSON document.
 */
struct Summary {
    uint64_t triples = 0;
    size_t unique_subjects = 0;
    size_t unique_objects = 0;
    size_t unique_relations = 0;

    Ranking<std::string> top_entities;
    Ranking<std::string> top_subjects;
    Ranking<std::string> top_objects;
    Ranking<std::string> top_relations;
    Ranking<int64_t> top_years;
    Ranking<std::string> temporal_markers;

    uint64_t temporal_records = 0;

    std::optional<Date> min_date;
    std::optional<Date> max_date;
    std::optional<int64_t> min_year;
    std::optional<int64_t> max_year;

    bool operator==(const Summary& other) const;
    bool operator!=(const Summary& other) const { return !(*this == other); }
};

/// Aggregate summary of a dataset plus optional per-split summaries
struct DatasetReport {
    Summary aggregate;
    std::map<std::string, Summary> files;   ///< filename -> summary (empty unless per-file)
};

/// Dataset name -> report, in discovery (sorted) order
using AnalysisResult = std::map<std::string, DatasetReport>;

} // namespace tkgstats
