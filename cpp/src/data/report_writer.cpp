#include "tkgstats/data/report_writer.hpp"
#include "tkgstats/core/errors.hpp"
#include <fstream>
#include <sstream>

namespace tkgstats {

namespace {

/// "key (count), key (count), ..."
template<typename Key>
std::string join_ranking(const Ranking<Key>& ranking) {
    std::ostringstream oss;
    for (size_t i = 0; i < ranking.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << ranking[i].first << " (" << ReportWriter::format_count(ranking[i].second) << ")";
    }
    return oss.str();
}

template<typename T>
std::string optional_text(const std::optional<T>& value) {
    if (!value) {
        return "None";
    }
    std::ostringstream oss;
    oss << *value;
    return oss.str();
}

std::string optional_text(const std::optional<Date>& value) {
    return value ? value->to_string() : "None";
}

template<typename Key>
nlohmann::ordered_json ranking_to_json(const Ranking<Key>& ranking) {
    nlohmann::ordered_json array = nlohmann::ordered_json::array();
    for (const auto& [key, count] : ranking) {
        array.push_back(nlohmann::ordered_json::array({key, count}));
    }
    return array;
}

template<typename T>
nlohmann::ordered_json optional_to_json(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

nlohmann::ordered_json optional_to_json(const std::optional<Date>& value) {
    if (!value) {
        return nullptr;
    }
    return value->to_string();
}

} // namespace

// ===== Text =====

std::vector<std::string> ReportWriter::humanize(const std::string& name, const Summary& summary) {
    std::vector<std::string> lines;
    lines.push_back("=== " + name + " ===");
    lines.push_back(
        "Total triples: " + format_count(summary.triples) +
        "; unique subjects: " + format_count(summary.unique_subjects) +
        "; unique objects: " + format_count(summary.unique_objects) +
        "; relations: " + format_count(summary.unique_relations));

    if (!summary.top_entities.empty()) {
        lines.push_back("Top entities: " + join_ranking(summary.top_entities));
    }
    if (!summary.top_relations.empty()) {
        lines.push_back("Top relations: " + join_ranking(summary.top_relations));
    }
    if (!summary.top_years.empty()) {
        lines.push_back("Most active years: " + join_ranking(summary.top_years));
    }
    if (!summary.temporal_markers.empty()) {
        lines.push_back(
            "Temporal markers: " + join_ranking(summary.temporal_markers) +
            "; with explicit temporal info: " + format_count(summary.temporal_records));
    }
    if (summary.min_date || summary.max_date) {
        lines.push_back("Date range: " + optional_text(summary.min_date) +
                        " to " + optional_text(summary.max_date));
    }
    if (summary.min_year || summary.max_year) {
        lines.push_back("Year span: " + optional_text(summary.min_year) +
                        " to " + optional_text(summary.max_year));
    }
    return lines;
}

void ReportWriter::write_text(std::ostream& out, const AnalysisResult& result, bool per_file) {
    for (const auto& [dataset, report] : result) {
        for (const auto& line : humanize(dataset, report.aggregate)) {
            out << line << "\n";
        }

        if (per_file) {
            for (const auto& [filename, summary] : report.files) {
                auto lines = humanize(dataset + "/" + filename, summary);
                out << "  " << lines[0] << "\n";
                for (size_t i = 1; i < lines.size(); ++i) {
                    out << "    " << lines[i] << "\n";
                }
            }
        }
        out << "\n";
    }
}

std::string ReportWriter::format_count(uint64_t value) {
    std::string digits = std::to_string(value);
    std::string grouped;
    grouped.reserve(digits.size() + digits.size() / 3);

    size_t lead = digits.size() % 3;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i > 0 && i >= lead && (i - lead) % 3 == 0) {
            grouped += ',';
        }
        grouped += digits[i];
    }
    return grouped;
}

// ===== JSON =====

nlohmann::ordered_json ReportWriter::summary_to_json(const Summary& summary) {
    nlohmann::ordered_json doc;
    doc["triples"] = summary.triples;
    doc["unique_subjects"] = summary.unique_subjects;
    doc["unique_objects"] = summary.unique_objects;
    doc["unique_relations"] = summary.unique_relations;
    doc["top_entities"] = ranking_to_json(summary.top_entities);
    doc["top_subjects"] = ranking_to_json(summary.top_subjects);
    doc["top_objects"] = ranking_to_json(summary.top_objects);
    doc["top_relations"] = ranking_to_json(summary.top_relations);
    doc["top_years"] = ranking_to_json(summary.top_years);
    doc["temporal_markers"] = ranking_to_json(summary.temporal_markers);
    doc["temporal_records"] = summary.temporal_records;
    doc["min_date"] = optional_to_json(summary.min_date);
    doc["max_date"] = optional_to_json(summary.max_date);
    doc["min_year"] = optional_to_json(summary.min_year);
    doc["max_year"] = optional_to_json(summary.max_year);
    return doc;
}

nlohmann::ordered_json ReportWriter::to_json(const AnalysisResult& result) {
    nlohmann::ordered_json doc = nlohmann::ordered_json::object();
    for (const auto& [dataset, report] : result) {
        nlohmann::ordered_json files = nlohmann::ordered_json::object();
        for (const auto& [filename, summary] : report.files) {
            files[filename] = summary_to_json(summary);
        }

        nlohmann::ordered_json entry;
        entry["aggregate"] = summary_to_json(report.aggregate);
        entry["files"] = std::move(files);
        doc[dataset] = std::move(entry);
    }
    return doc;
}

std::string ReportWriter::dump(const nlohmann::ordered_json& doc) {
    // Identifiers are not guaranteed to be valid UTF-8; replace bad bytes
    // instead of failing the whole report
    return doc.dump(2, ' ', true, nlohmann::ordered_json::error_handler_t::replace);
}

void ReportWriter::write_json(const std::filesystem::path& path, const AnalysisResult& result) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw IoError("Cannot create file", path);
    }

    file << dump(to_json(result)) << "\n";
    file.close();
    if (!file) {
        throw IoError("Failed to write file", path);
    }
}

} // namespace tkgstats
