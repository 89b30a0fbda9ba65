#pragma once

#include "tkgstats/core/types.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace tkgstats {

/// Tail sampling options
struct TailSampleOptions {
    uint64_t max_frequency = 5;         ///< Tail threshold (inclusive)
    size_t sample_size = 10;            ///< Triples to draw
    std::optional<uint64_t> seed;       ///< Fixed seed for reproducible draws
};

/// Samples triples that touch low-frequency (tail) entities
class TailSampler {
public:
    TailSampler() = delete;  // Static class, no instances

    /// Triples of every accepted row of a split (same rules as the
    /// statistics accumulator). Throws IoError.
    static std::vector<Triple> load_triples(const std::filesystem::path& path);

    /// Entities whose subject+object frequency is <= max_frequency,
    /// in first-seen order
    static std::vector<std::string> find_tail_entities(const std::vector<Triple>& triples,
                                                       uint64_t max_frequency);

    /// Triples touching a tail entity: all of them when there are at most
    /// `sample_size`, otherwise a uniform sample of `sample_size` kept in
    /// file order
    static std::vector<Triple> sample_tail_triples(const std::vector<Triple>& triples,
                                                   const std::vector<std::string>& tail_entities,
                                                   size_t sample_size,
                                                   std::mt19937_64& rng);

    /// Engine seeded from `seed`, or from std::random_device when absent
    static std::mt19937_64 make_engine(const std::optional<uint64_t>& seed);
};

} // namespace tkgstats
