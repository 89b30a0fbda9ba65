#include "tkgstats/core/errors.hpp"
#include "tkgstats/processing/tail_sampler.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

void print_usage(std::ostream &out) {
  out << "Usage: tkg_sample_tail --dataset PATH [--max-frequency N] [--sample-size N] [--seed N]\n"
         "\n"
         "Sample triples that involve entities with low frequency.\n"
         "\n"
         "  --dataset PATH       dataset split (tab-separated)\n"
         "  --max-frequency N    maximum frequency of a tail entity (default: 5)\n"
         "  --sample-size N      number of tail triples to sample (default: 10)\n"
         "  --seed N             random seed for reproducibility\n";
}

bool parse_u64(const std::string &text, std::uint64_t &out) {
  if (text.empty() || text.front() == '-') {
    return false;
  }
  try {
    std::size_t pos = 0;
    out = std::stoull(text, &pos);
    return pos == text.size();
  } catch (const std::exception &) {
    return false;
  }
}

} // namespace

int main(int argc, char **argv) {
  std::filesystem::path dataset;
  tkgstats::TailSampleOptions opts;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);
    std::uint64_t value = 0;
    if (arg == "--dataset" && i + 1 < argc) {
      dataset = argv[++i];
    } else if (arg == "--max-frequency" && i + 1 < argc) {
      if (!parse_u64(argv[++i], value)) {
        std::cerr << "tkg_sample_tail: --max-frequency expects a non-negative integer\n";
        return 2;
      }
      opts.max_frequency = value;
    } else if (arg == "--sample-size" && i + 1 < argc) {
      if (!parse_u64(argv[++i], value)) {
        std::cerr << "tkg_sample_tail: --sample-size expects a non-negative integer\n";
        return 2;
      }
      opts.sample_size = static_cast<std::size_t>(value);
    } else if (arg == "--seed" && i + 1 < argc) {
      if (!parse_u64(argv[++i], value)) {
        std::cerr << "tkg_sample_tail: --seed expects a non-negative integer\n";
        return 2;
      }
      opts.seed = value;
    } else if (arg == "--help" || arg == "-h") {
      print_usage(std::cout);
      return 0;
    } else {
      std::cerr << "tkg_sample_tail: unrecognized argument '" << arg << "'\n";
      print_usage(std::cerr);
      return 2;
    }
  }

  if (dataset.empty()) {
    std::cerr << "tkg_sample_tail: --dataset is required\n";
    print_usage(std::cerr);
    return 2;
  }

  try {
    auto triples = tkgstats::TailSampler::load_triples(dataset);
    if (triples.empty()) {
      throw tkgstats::ConfigurationError("No triples found in " + dataset.string() + ".");
    }

    auto tail = tkgstats::TailSampler::find_tail_entities(triples, opts.max_frequency);
    if (tail.empty()) {
      std::cout << "No entities fall below the specified frequency threshold.\n";
      return 0;
    }

    auto rng = tkgstats::TailSampler::make_engine(opts.seed);
    auto samples = tkgstats::TailSampler::sample_tail_triples(triples, tail, opts.sample_size, rng);

    std::cout << "Found " << tail.size() << " tail entities.\n";
    std::cout << "Showing " << samples.size() << " sampled triples:\n";
    for (const auto &triple : samples) {
      std::cout << triple.subject << '\t' << triple.relation << '\t' << triple.object << '\n';
    }
    return 0;
  } catch (const std::exception &ex) {
    std::cerr << "Fatal: " << ex.what() << '\n';
    return 1;
  }
}
