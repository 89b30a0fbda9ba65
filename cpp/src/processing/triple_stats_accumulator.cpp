#include "tkgstats/processing/triple_stats_accumulator.hpp"
#include "tkgstats/data/triple_reader.hpp"
#include <string>
#include <utility>

namespace tkgstats {

namespace {

constexpr size_t kTripleColumns = 3;

/// Widen [min, max] to include `value`
template<typename T>
void update_range(std::optional<T>& min_value, std::optional<T>& max_value, const T& value) {
    if (!min_value || value < *min_value) {
        min_value = value;
    }
    if (!max_value || value > *max_value) {
        max_value = value;
    }
}

} // namespace

TripleStatsAccumulator::TripleStatsAccumulator(DatasetType type)
    : type_(type)
{
}

bool TripleStatsAccumulator::add_line(std::string_view line) {
    line = TripleReader::trim(line);
    if (line.empty()) {
        return false;
    }

    TripleReader::split_line(line, '\t', scratch_);
    return add_columns(scratch_);
}

bool TripleStatsAccumulator::add_columns(const std::vector<std::string_view>& columns) {
    if (columns.size() < kTripleColumns) {
        return false;
    }

    std::string subject(columns[0]);
    std::string relation(columns[1]);
    std::string object(columns[2]);

    stats_.triples++;
    stats_.subjects.insert(subject);
    stats_.objects.insert(object);
    stats_.relations.insert(relation);

    stats_.subject_freq.add(subject);
    stats_.object_freq.add(object);
    stats_.entity_freq.add(subject);
    stats_.entity_freq.add(object);
    stats_.relation_freq.add(relation);

    // Triple counts above are kept whatever the temporal columns contain
    apply_temporal(TemporalExtractor::extract(columns, type_));
    return true;
}

Stats TripleStatsAccumulator::finish() {
    Stats result = std::move(stats_);
    stats_ = Stats();
    return result;
}

Stats TripleStatsAccumulator::process_file(const std::filesystem::path& path, DatasetType type) {
    TripleStatsAccumulator accumulator(type);
    TripleReader reader(path);

    std::vector<std::string_view> columns;
    while (reader.next(columns)) {
        accumulator.add_columns(columns);
    }
    return accumulator.finish();
}

// ===== Internal Methods =====

void TripleStatsAccumulator::apply_temporal(const TemporalFields& fields) {
    if (fields.marker) {
        stats_.marker_freq.add(*fields.marker);
        stats_.temporal_records++;
    }

    if (fields.year) {
        stats_.year_freq.add(*fields.year);
        update_range(stats_.min_year, stats_.max_year, *fields.year);
    }

    if (fields.date) {
        update_range(stats_.min_date, stats_.max_date, *fields.date);
    }
}

} // namespace tkgstats
