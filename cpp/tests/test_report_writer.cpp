#include "tkgstats/core/errors.hpp"
#include "tkgstats/data/report_writer.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

using tkgstats::AnalysisResult;
using tkgstats::Date;
using tkgstats::ReportWriter;
using tkgstats::Summary;

void check(bool cond, const std::string &msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << '\n';
    std::exit(1);
  }
}

Summary sample_summary() {
  Summary s;
  s.triples = 1234567;
  s.unique_subjects = 1000;
  s.unique_objects = 999;
  s.unique_relations = 12;
  s.top_entities = {{"Q1", 2500}, {"Q2", 7}};
  s.top_relations = {{"P31", 1200}};
  s.top_years = {{2014, 3000}};
  s.temporal_markers = {{"since", 40}};
  s.temporal_records = 40;
  s.min_year = 1990;
  return s;
}

void test_format_count() {
  check(ReportWriter::format_count(0) == "0", "zero");
  check(ReportWriter::format_count(999) == "999", "no separator below a thousand");
  check(ReportWriter::format_count(1000) == "1,000", "one separator");
  check(ReportWriter::format_count(123456) == "123,456", "full group");
  check(ReportWriter::format_count(1234567) == "1,234,567", "two separators");
}

void test_humanize_lines() {
  const auto lines = ReportWriter::humanize("ICEWS14", sample_summary());
  const std::vector<std::string> expected = {
      "=== ICEWS14 ===",
      "Total triples: 1,234,567; unique subjects: 1,000; unique objects: 999; relations: 12",
      "Top entities: Q1 (2,500), Q2 (7)",
      "Top relations: P31 (1,200)",
      "Most active years: 2014 (3,000)",
      "Temporal markers: since (40); with explicit temporal info: 40",
      "Year span: 1990 to None",
  };
  check(lines == expected, "labeled lines with absent bound rendered as None");
}

void test_humanize_omits_empty_sections() {
  Summary empty;
  const auto lines = ReportWriter::humanize("empty", empty);
  check(lines.size() == 2, "only header and totals for an empty summary");

  Summary dated;
  dated.min_date = Date(2014, 1, 1);
  dated.max_date = Date(2014, 12, 31);
  const auto dated_lines = ReportWriter::humanize("dated", dated);
  check(dated_lines.size() == 3 && dated_lines[2] == "Date range: 2014-01-01 to 2014-12-31", "date range line");
}

void test_write_text_per_file() {
  AnalysisResult result;
  result["wikidata"].aggregate.triples = 3;
  result["wikidata"].files["train.txt"].triples = 2;

  std::ostringstream out;
  ReportWriter::write_text(out, result, true);
  const std::string expected =
      "=== wikidata ===\n"
      "Total triples: 3; unique subjects: 0; unique objects: 0; relations: 0\n"
      "  === wikidata/train.txt ===\n"
      "    Total triples: 2; unique subjects: 0; unique objects: 0; relations: 0\n"
      "\n";
  check(out.str() == expected, "per-file blocks indented under the dataset");

  std::ostringstream aggregate_only;
  ReportWriter::write_text(aggregate_only, result, false);
  check(aggregate_only.str().find("train.txt") == std::string::npos, "file blocks hidden without per-file");
}

void test_summary_json_layout() {
  const nlohmann::ordered_json doc = ReportWriter::summary_to_json(sample_summary());

  const std::vector<std::string> expected_keys = {
      "triples", "unique_subjects", "unique_objects", "unique_relations",
      "top_entities", "top_subjects", "top_objects", "top_relations",
      "top_years", "temporal_markers", "temporal_records",
      "min_date", "max_date", "min_year", "max_year",
  };
  std::vector<std::string> keys;
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    keys.push_back(it.key());
  }
  check(keys == expected_keys, "summary keys in report order");

  check(doc["top_entities"][0][0] == "Q1" && doc["top_entities"][0][1] == 2500, "ranking as [key, count]");
  check(doc["top_years"][0][0] == 2014, "year keys stay integers");
  check(doc["min_date"].is_null() && doc["max_year"].is_null(), "absent bounds are null");
  check(doc["min_year"] == 1990, "present bound");
}

void test_write_json_file() {
  AnalysisResult result;
  result["yago"].aggregate = sample_summary();
  result["yago"].aggregate.top_subjects = {{"Caf\xc3\xa9", 1}};
  result["yago"].files["test.txt"].triples = 1;

  const fs::path path = fs::temp_directory_path() / "tkgstats_report_writer.json";
  ReportWriter::write_json(path, result);

  std::ifstream in(path, std::ios::binary);
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  check(!text.empty() && text.back() == '\n', "trailing newline");
  check(text.find("\"Caf\\u00e9\"") != std::string::npos, "non-ASCII escaped");
  check(text.find("\n  \"yago\": {") != std::string::npos, "two-space indentation");

  const auto doc = nlohmann::ordered_json::parse(text);
  check(doc["yago"].begin().key() == "aggregate", "aggregate before files");
  check(doc["yago"]["files"]["test.txt"]["triples"] == 1, "per-file summary serialized");
  check(doc["yago"]["aggregate"]["triples"] == 1234567, "aggregate serialized");

  fs::remove(path);
}

void test_write_json_unwritable() {
  bool thrown = false;
  try {
    ReportWriter::write_json(fs::temp_directory_path() / "tkgstats_no_such_dir" / "out.json", AnalysisResult());
  } catch (const tkgstats::IoError &) {
    thrown = true;
  }
  check(thrown, "unwritable destination raises IoError");
}

} // namespace

int main() {
  test_format_count();
  test_humanize_lines();
  test_humanize_omits_empty_sections();
  test_write_text_per_file();
  test_summary_json_layout();
  test_write_json_file();
  test_write_json_unwritable();
  std::cout << "tkgstats report writer tests passed\n";
  return 0;
}
