#include "tkgstats/core/errors.hpp"
#include "tkgstats/processing/label_join.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

void print_usage(std::ostream &out) {
  out << "Usage: tkg_join_labels --dataset PATH --mapping PATH [--output PATH]\n"
         "                       [--delimiter C] [--missing-value TEXT]\n"
         "\n"
         "Attach labels to the subject/object columns of a dataset split.\n"
         "\n"
         "  --dataset PATH        dataset split (tab-separated)\n"
         "  --mapping PATH        two-column mapping file (entity ID, label)\n"
         "  --output PATH         output path (default: <dataset>.labeled)\n"
         "  --delimiter C         column delimiter (default: \\t)\n"
         "  --missing-value TEXT  placeholder for unmapped entities (default: empty)\n";
}

} // namespace

int main(int argc, char **argv) {
  std::filesystem::path dataset;
  std::filesystem::path mapping_path;
  std::string delimiter = "\\t";
  tkgstats::LabelJoinOptions opts;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);
    if (arg == "--dataset" && i + 1 < argc) {
      dataset = argv[++i];
    } else if (arg == "--mapping" && i + 1 < argc) {
      mapping_path = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      opts.output = argv[++i];
    } else if (arg == "--delimiter" && i + 1 < argc) {
      delimiter = argv[++i];
    } else if (arg == "--missing-value" && i + 1 < argc) {
      opts.missing_value = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage(std::cout);
      return 0;
    } else {
      std::cerr << "tkg_join_labels: unrecognized argument '" << arg << "'\n";
      print_usage(std::cerr);
      return 2;
    }
  }

  if (dataset.empty() || mapping_path.empty()) {
    std::cerr << "tkg_join_labels: --dataset and --mapping are required\n";
    print_usage(std::cerr);
    return 2;
  }

  try {
    opts.delimiter = tkgstats::LabelJoiner::resolve_delimiter(delimiter);

    auto mapping = tkgstats::LabelJoiner::load_mapping(mapping_path, opts.delimiter);
    if (mapping.empty()) {
      throw tkgstats::ConfigurationError("No entries found in mapping file " +
                                         mapping_path.string() + ".");
    }

    auto rows = tkgstats::LabelJoiner::attach_labels(dataset, mapping, opts);
    std::cerr << "[LABELS] Wrote " << rows << " rows to "
              << (opts.output.empty() ? tkgstats::LabelJoiner::default_output_path(dataset)
                                      : opts.output).string()
              << std::endl;
    return 0;
  } catch (const std::exception &ex) {
    std::cerr << "Fatal: " << ex.what() << '\n';
    return 1;
  }
}
