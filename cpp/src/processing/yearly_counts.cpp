#include "tkgstats/processing/yearly_counts.hpp"
#include "tkgstats/core/errors.hpp"
#include "tkgstats/processing/arrow_utils.hpp"
#include "tkgstats/data/triple_reader.hpp"
#include "tkgstats/processing/temporal_extractor.hpp"
#include "tkgstats/sources/dataset_source.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <algorithm>
#include <string_view>
#include <utility>
#include <vector>

namespace tkgstats {

FrequencyCounter<int64_t> YearlyCounts::count_years(const std::filesystem::path& dataset_dir,
                                                    DatasetType type,
                                                    const std::string& extension) {
    FrequencyCounter<int64_t> counts;
    std::vector<std::string_view> columns;
    for (const auto& path : DatasetSource::list_split_files(dataset_dir, extension)) {
        TripleReader reader(path);
        while (reader.next(columns)) {
            if (auto year = TemporalExtractor::extract(columns, type).year) {
                counts.add(*year);
            }
        }
    }
    return counts;
}

std::shared_ptr<arrow::Table> YearlyCounts::make_year_table(const FrequencyCounter<int64_t>& counts) {
    std::vector<std::pair<int64_t, uint64_t>> rows(counts.entries().begin(), counts.entries().end());
    std::sort(rows.begin(), rows.end());

    std::vector<int64_t> years;
    std::vector<int64_t> triples;
    years.reserve(rows.size());
    triples.reserve(rows.size());
    for (const auto& [year, count] : rows) {
        years.push_back(year);
        triples.push_back(static_cast<int64_t>(count));
    }

    auto schema = arrow::schema({
        arrow::field("year", arrow::int64(), false),
        arrow::field("triples", arrow::int64(), false),
    });
    std::vector<std::shared_ptr<arrow::Array>> columns = {
        arrow_utils::to_int64_array(years),
        arrow_utils::to_int64_array(triples),
    };
    return arrow::Table::Make(schema, columns);
}

void YearlyCounts::write_csv(const arrow::Table& table, const std::filesystem::path& path) {
    auto opened = arrow::io::FileOutputStream::Open(path.string());
    if (!opened.ok()) {
        throw IoError("Cannot create file", path);
    }
    std::shared_ptr<arrow::io::FileOutputStream> output = opened.MoveValueUnsafe();

    arrow::Status status = arrow::csv::WriteCSV(table, arrow::csv::WriteOptions::Defaults(),
                                                output.get());
    if (status.ok()) {
        status = output->Close();
    }
    if (!status.ok()) {
        throw IoError("Failed to write file (" + status.ToString() + ")", path);
    }
}

std::filesystem::path YearlyCounts::output_path(const std::filesystem::path& output_dir,
                                                const std::string& dataset) {
    return output_dir / (dataset + "_yearly_counts.csv");
}

} // namespace tkgstats
