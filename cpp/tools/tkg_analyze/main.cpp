#include "tkgstats/core/analyzer.hpp"
#include "tkgstats/core/version.hpp"
#include "tkgstats/data/report_writer.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

void print_usage(std::ostream &out) {
  out << "Usage: tkg_analyze [--base-dir DIR] [--top-n N] [--datasets NAME...]\n"
         "                   [--json-output PATH] [--per-file] [--quiet] [--version]\n"
         "\n"
         "Compute descriptive statistics for temporal KG datasets.\n"
         "\n"
         "  --base-dir DIR      folder containing dataset subdirectories (default: TemporalKGs)\n"
         "  --top-n N           number of top entities/relations to report (default: 5)\n"
         "  --datasets NAME...  subset of dataset folders to analyse (case-insensitive)\n"
         "  --json-output PATH  also write the full statistics as JSON\n"
         "  --per-file          include per-split summaries in the JSON output and console log\n"
         "  --quiet             do not log progress to stderr\n";
}

bool parse_count(const std::string &text, std::size_t &out) {
  if (text.empty() || text.front() == '-') {
    return false;
  }
  try {
    std::size_t pos = 0;
    out = static_cast<std::size_t>(std::stoull(text, &pos));
    return pos == text.size();
  } catch (const std::exception &) {
    return false;
  }
}

} // namespace

int main(int argc, char **argv) {
  tkgstats::AnalyzeOptions opts;
  opts.verbose = true;
  std::optional<std::filesystem::path> json_output;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);
    if (arg == "--base-dir" && i + 1 < argc) {
      opts.base_dir = argv[++i];
    } else if (arg == "--top-n" && i + 1 < argc) {
      if (!parse_count(argv[++i], opts.top_n)) {
        std::cerr << "tkg_analyze: --top-n expects a non-negative integer, got '" << argv[i] << "'\n";
        return 2;
      }
    } else if (arg == "--datasets") {
      while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
        opts.datasets.emplace_back(argv[++i]);
      }
      if (opts.datasets.empty()) {
        std::cerr << "tkg_analyze: --datasets expects at least one name\n";
        return 2;
      }
    } else if (arg == "--json-output" && i + 1 < argc) {
      json_output = argv[++i];
    } else if (arg == "--per-file") {
      opts.per_file = true;
    } else if (arg == "--quiet") {
      opts.verbose = false;
    } else if (arg == "--version") {
      std::cout << tkgstats::version_banner("tkg_analyze") << "\n";
      return 0;
    } else if (arg == "--help" || arg == "-h") {
      print_usage(std::cout);
      return 0;
    } else {
      std::cerr << "tkg_analyze: unrecognized argument '" << arg << "'\n";
      print_usage(std::cerr);
      return 2;
    }
  }

  try {
    tkgstats::Analyzer analyzer(opts);
    tkgstats::AnalysisResult result = analyzer.run();

    tkgstats::ReportWriter::write_text(std::cout, result, opts.per_file);
    std::cout.flush();

    if (json_output) {
      tkgstats::ReportWriter::write_json(*json_output, result);
      if (opts.verbose) {
        std::cerr << "[TKG] Wrote " << json_output->string() << std::endl;
      }
    }
    return 0;
  } catch (const std::exception &ex) {
    std::cerr << "Fatal: " << ex.what() << '\n';
    return 1;
  }
}
