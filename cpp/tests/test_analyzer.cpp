#include "tkgstats/core/analyzer.hpp"
#include "tkgstats/core/errors.hpp"
#include "tkgstats/core/version.hpp"
#include "tkgstats/sources/dataset_source.hpp"

#include <nlohmann/json.hpp>

#include <sys/wait.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

using tkgstats::AnalysisResult;
using tkgstats::AnalyzeOptions;
using tkgstats::Analyzer;
using tkgstats::ConfigurationError;
using tkgstats::DatasetType;
using tkgstats::Date;

void check(bool cond, const std::string &msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << '\n';
    std::exit(1);
  }
}

void write_file(const fs::path &path, const std::string &content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

/// Fresh base directory with three small datasets
fs::path make_fixture(const std::string &name) {
  const fs::path base = fs::temp_directory_path() / name;
  fs::remove_all(base);

  write_file(base / "ICEWS14" / "train.txt",
             "A\tr1\tB\t2014-01-01\n"
             "A\tr2\tC\t2014-06-30\n");
  write_file(base / "ICEWS14" / "test.txt",
             "B\tr1\tA\t2013-12-31\n");
  write_file(base / "ICEWS14" / "README.md", "not a split\n");

  write_file(base / "wikidata12k" / "train.txt",
             "Q1\tP1\tQ2\tsince\t1990\n"
             "Q2\tP1\tQ3\tuntil\t2005\n");

  write_file(base / "plain" / "valid.txt", "x\ty\tz\n");
  return base;
}

std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/// Run tkg_analyze with `args`, sending stdout/stderr to the given files.
/// Returns the exit status, -1 if the tool did not exit normally.
int run_analyze(const std::string &args, const fs::path &out, const fs::path &err) {
  const std::string command = std::string("\"") + TKG_ANALYZE_EXE + "\" " + args +
                              " > \"" + out.string() + "\" 2> \"" + err.string() + "\"";
  const int status = std::system(command.c_str());
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

std::string quoted(const fs::path &path) { return "\"" + path.string() + "\""; }

template <typename Fn>
bool throws_configuration_error(Fn fn) {
  try {
    fn();
  } catch (const ConfigurationError &) {
    return true;
  }
  return false;
}

void test_missing_or_empty_base_dir() {
  AnalyzeOptions opts;
  opts.base_dir = fs::temp_directory_path() / "tkgstats_analyzer_missing";
  fs::remove_all(opts.base_dir);
  check(throws_configuration_error([&] { Analyzer(opts).run(); }), "missing base dir is fatal");

  fs::create_directories(opts.base_dir);
  check(throws_configuration_error([&] { Analyzer(opts).run(); }), "empty base dir is fatal");
  fs::remove_all(opts.base_dir);
}

void test_unmatched_filter() {
  const fs::path base = make_fixture("tkgstats_analyzer_filter");
  AnalyzeOptions opts;
  opts.base_dir = base;
  opts.datasets = {"yago11k"};
  check(throws_configuration_error([&] { Analyzer(opts).run(); }), "filter matching nothing is fatal");
  fs::remove_all(base);
}

void test_discovery_is_sorted_and_filtered() {
  const fs::path base = make_fixture("tkgstats_analyzer_discovery");

  const auto all = tkgstats::DatasetSource::discover_datasets(base, {});
  const std::vector<std::string> expected = {"ICEWS14", "plain", "wikidata12k"};
  check(all == expected, "subdirectories listed in sorted order");

  const auto some = tkgstats::DatasetSource::discover_datasets(base, {"icews14", "WIKIDATA12K"});
  const std::vector<std::string> expected_some = {"ICEWS14", "wikidata12k"};
  check(some == expected_some, "name filter is case-insensitive");

  const auto splits = tkgstats::DatasetSource::list_split_files(base / "ICEWS14", ".txt");
  check(splits.size() == 2, "only .txt files are splits");
  check(splits[0].filename() == "test.txt" && splits[1].filename() == "train.txt", "splits sorted by name");

  const auto entry = tkgstats::DatasetSource::make_entry(base, "ICEWS14");
  check(entry.type == DatasetType::EVENT_CALENDAR && entry.directory == base / "ICEWS14", "entry classified");

  fs::remove_all(base);
}

void test_run_aggregates_datasets() {
  const fs::path base = make_fixture("tkgstats_analyzer_run");
  AnalyzeOptions opts;
  opts.base_dir = base;
  opts.top_n = 3;

  const AnalysisResult result = Analyzer(opts).run();
  check(result.size() == 3, "every dataset reported");

  const auto &icews = result.at("ICEWS14").aggregate;
  check(icews.triples == 3, "splits folded into the aggregate");
  check(icews.min_date == Date(2013, 12, 31) && icews.max_date == Date(2014, 6, 30), "aggregate date range");
  check(icews.min_year == 2013 && icews.max_year == 2014, "aggregate year span");
  check(result.at("ICEWS14").files.empty(), "no per-file summaries unless requested");

  const auto &wiki = result.at("wikidata12k").aggregate;
  check(wiki.temporal_records == 2, "linked data markers counted");
  check(wiki.top_entities.size() == 3 && wiki.top_entities.front().first == "Q2", "top entity of linked data");

  const auto &plain = result.at("plain").aggregate;
  check(plain.triples == 1 && plain.top_years.empty() && !plain.min_date, "generic dataset has no temporal data");

  fs::remove_all(base);
}

void test_per_file_summaries() {
  const fs::path base = make_fixture("tkgstats_analyzer_per_file");
  AnalyzeOptions opts;
  opts.base_dir = base;
  opts.datasets = {"icews14"};
  opts.per_file = true;

  const AnalysisResult result = Analyzer(opts).run();
  check(result.size() == 1 && result.count("ICEWS14") == 1, "filter keeps the directory's own name");

  const auto &files = result.at("ICEWS14").files;
  check(files.size() == 2, "one summary per split");
  check(files.at("train.txt").triples == 2 && files.at("test.txt").triples == 1, "per-split triple counts");
  check(files.at("test.txt").min_date == Date(2013, 12, 31), "per-split date range");

  const auto stats = Analyzer(opts).collect_dataset_stats();
  check(stats.at("ICEWS14").triples == 3, "collect_dataset_stats aggregates splits");
  check(stats.at("ICEWS14").entity_freq.total() == 6, "aggregate entity occurrences");

  fs::remove_all(base);
}

void test_unreadable_split_aborts_run() {
  const fs::path base = make_fixture("tkgstats_analyzer_broken");
  const fs::path broken = base / "wikidata12k" / "valid.txt";
  fs::create_symlink(base / "wikidata12k" / "missing.tsv", broken);

  const auto splits = tkgstats::DatasetSource::list_split_files(base / "wikidata12k", ".txt");
  check(splits.size() == 2 && splits[1] == broken, "dangling split still listed");

  AnalyzeOptions opts;
  opts.base_dir = base;

  bool thrown = false;
  fs::path failed;
  AnalysisResult result;
  try {
    result = Analyzer(opts).run();
  } catch (const tkgstats::IoError &ex) {
    thrown = true;
    failed = ex.path();
  }
  check(thrown, "unreadable split aborts the whole run");
  check(failed == broken, "error names the unreadable split");
  check(result.empty(), "no partial result after a failure");

  fs::remove_all(base);
}

void test_cli_exit_status() {
  const fs::path base = make_fixture("tkgstats_analyzer_cli");
  const fs::path scratch = fs::temp_directory_path() / "tkgstats_analyzer_cli_out";
  fs::remove_all(scratch);
  fs::create_directories(scratch);
  const fs::path out = scratch / "stdout.txt";
  const fs::path err = scratch / "stderr.txt";
  const fs::path report = scratch / "report.json";

  check(run_analyze("--base-dir " + quoted(base) + " --quiet --top-n 2 --json-output " + quoted(report),
                    out, err) == 0,
        "successful run exits 0");
  check(read_file(out).find("=== ICEWS14 ===") != std::string::npos, "text report on stdout");
  const auto doc = nlohmann::json::parse(read_file(report));
  check(doc["ICEWS14"]["aggregate"]["triples"] == 3, "JSON report written");

  check(run_analyze("--version", out, err) == 0, "--version exits 0");
  check(read_file(out) == tkgstats::version_banner("tkg_analyze") + "\n", "version banner");
  check(tkgstats::version_string() == std::to_string(tkgstats::kVersionMajor) + "." +
                                          std::to_string(tkgstats::kVersionMinor) + "." +
                                          std::to_string(tkgstats::kVersionPatch),
        "dotted version string");

  check(run_analyze("--top-n -1", out, err) == 2, "negative top-n is a usage error");
  check(run_analyze("--no-such-flag", out, err) == 2, "unknown flag is a usage error");

  check(run_analyze("--base-dir " + quoted(scratch / "missing"), out, err) == 1,
        "missing base dir exits 1");
  check(read_file(err).find("Fatal: ") != std::string::npos, "configuration error reported as Fatal");

  const fs::path broken = base / "plain" / "test.txt";
  fs::create_symlink(base / "plain" / "missing.tsv", broken);
  check(run_analyze("--base-dir " + quoted(base) + " --quiet", out, err) == 1, "I/O error exits 1");
  check(read_file(err).find("Fatal: Cannot open file: " + broken.string()) != std::string::npos,
        "I/O error names the split");

  fs::remove_all(base);
  fs::remove_all(scratch);
}

} // namespace

int main() {
  test_missing_or_empty_base_dir();
  test_unmatched_filter();
  test_discovery_is_sorted_and_filtered();
  test_run_aggregates_datasets();
  test_per_file_summaries();
  test_unreadable_split_aborts_run();
  test_cli_exit_status();
  std::cout << "tkgstats analyzer tests passed\n";
  return 0;
}
