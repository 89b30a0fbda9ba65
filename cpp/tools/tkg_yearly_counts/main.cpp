#include "tkgstats/core/analyzer.hpp"
#include "tkgstats/core/errors.hpp"
#include "tkgstats/processing/yearly_counts.hpp"
#include "tkgstats/sources/dataset_source.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace {

void print_usage(std::ostream &out) {
  out << "Usage: tkg_yearly_counts [--base-dir DIR] [--datasets NAME...] [--output-dir DIR]\n"
         "\n"
         "Export yearly triple counts of temporal KG datasets as CSV tables.\n"
         "\n"
         "  --base-dir DIR      folder containing dataset subdirectories (default: TemporalKGs)\n"
         "  --datasets NAME...  dataset folders to export (default: all)\n"
         "  --output-dir DIR    directory receiving <dataset>_yearly_counts.csv (default: figures)\n";
}

} // namespace

int main(int argc, char **argv) {
  std::filesystem::path base_dir = tkgstats::constants::DEFAULT_BASE_DIR;
  std::filesystem::path output_dir = "figures";
  std::vector<std::string> datasets;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);
    if (arg == "--base-dir" && i + 1 < argc) {
      base_dir = argv[++i];
    } else if (arg == "--datasets") {
      while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
        datasets.emplace_back(argv[++i]);
      }
    } else if (arg == "--output-dir" && i + 1 < argc) {
      output_dir = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage(std::cout);
      return 0;
    } else {
      std::cerr << "tkg_yearly_counts: unrecognized argument '" << arg << "'\n";
      print_usage(std::cerr);
      return 2;
    }
  }

  try {
    std::error_code ec;
    if (!std::filesystem::exists(base_dir, ec)) {
      throw tkgstats::ConfigurationError("Base directory " + base_dir.string() +
                                         " does not exist.");
    }

    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
      throw tkgstats::IoError("Cannot create directory", output_dir);
    }

    auto targets = tkgstats::DatasetSource::discover_datasets(base_dir, datasets);
    if (targets.empty()) {
      throw tkgstats::ConfigurationError("No matching dataset folders were found.");
    }

    for (const auto &name : targets) {
      auto entry = tkgstats::DatasetSource::make_entry(base_dir, name);
      auto counts = tkgstats::YearlyCounts::count_years(entry.directory, entry.type,
                                                        tkgstats::constants::SPLIT_EXTENSION);
      if (counts.empty()) {
        std::cout << "[warn] Skipping " << name << ": no yearly information found.\n";
        continue;
      }

      auto path = tkgstats::YearlyCounts::output_path(output_dir, name);
      tkgstats::YearlyCounts::write_csv(*tkgstats::YearlyCounts::make_year_table(counts), path);
      std::cout << "[ok] Wrote " << path.string() << "\n";
    }
    return 0;
  } catch (const std::exception &ex) {
    std::cerr << "Fatal: " << ex.what() << '\n';
    return 1;
  }
}
