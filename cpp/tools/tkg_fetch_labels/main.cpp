#include "tkgstats/core/analyzer.hpp"
#include "tkgstats/core/errors.hpp"
#include "tkgstats/processing/label_fetch.hpp"

#include <curl/curl.h>

#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void print_usage(std::ostream &out) {
  out << "Usage: tkg_fetch_labels [--dataset-dir DIR] [--output PATH] [--language CODE]\n"
         "                        [--sleep SECONDS]\n"
         "\n"
         "Build a Wikidata entity-label mapping for the Q-identifiers of a dataset.\n"
         "\n"
         "  --dataset-dir DIR  dataset folder with .txt splits (default: TemporalKGs/wikidata)\n"
         "  --output PATH      mapping file to write (default: data/wikidata_labels.tsv)\n"
         "  --language CODE    label language (default: en)\n"
         "  --sleep SECONDS    pause between API requests (default: 0.1)\n";
}

} // namespace

int main(int argc, char **argv) {
  std::filesystem::path dataset_dir = std::filesystem::path("TemporalKGs") / "wikidata";
  std::filesystem::path output = std::filesystem::path("data") / "wikidata_labels.tsv";
  tkgstats::LabelFetchOptions opts;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);
    if (arg == "--dataset-dir" && i + 1 < argc) {
      dataset_dir = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      output = argv[++i];
    } else if (arg == "--language" && i + 1 < argc) {
      opts.language = argv[++i];
    } else if (arg == "--sleep" && i + 1 < argc) {
      const std::string value(argv[++i]);
      try {
        size_t used = 0;
        opts.delay_seconds = std::stod(value, &used);
        if (used != value.size() || opts.delay_seconds < 0) {
          throw std::invalid_argument(value);
        }
      } catch (const std::exception &) {
        std::cerr << "tkg_fetch_labels: --sleep expects a non-negative number, got '" << value << "'\n";
        return 2;
      }
    } else if (arg == "--help" || arg == "-h") {
      print_usage(std::cout);
      return 0;
    } else {
      std::cerr << "tkg_fetch_labels: unrecognized argument '" << arg << "'\n";
      print_usage(std::cerr);
      return 2;
    }
  }

  if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
    std::cerr << "Fatal: failed to initialize libcurl\n";
    return 1;
  }
  struct CurlGlobal {
    ~CurlGlobal() { curl_global_cleanup(); }
  } curl_global;

  try {
    auto ids = tkgstats::LabelFetcher::collect_entity_ids(dataset_dir,
                                                          tkgstats::constants::SPLIT_EXTENSION);
    if (ids.empty()) {
      throw tkgstats::ConfigurationError("No Wikidata entity identifiers found under " +
                                         dataset_dir.string() + ".");
    }
    std::cerr << "[LABELS] " << ids.size() << " entity identifiers in " << dataset_dir.string()
              << std::endl;

    auto mapping = tkgstats::LabelFetcher::build_mapping(ids, opts);
    tkgstats::LabelFetcher::write_mapping(output, mapping);
    std::cout << "[ok] Wrote " << mapping.size() << " labels to " << output.string() << "\n";
    return 0;
  } catch (const std::exception &ex) {
    std::cerr << "Fatal: " << ex.what() << '\n';
    return 1;
  }
}
