#include "tkgstats/processing/tail_sampler.hpp"
#include "tkgstats/data/triple_reader.hpp"
#include <algorithm>
#include <iterator>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace tkgstats {

std::vector<Triple> TailSampler::load_triples(const std::filesystem::path& path) {
    std::vector<Triple> triples;
    TripleReader reader(path);

    std::vector<std::string_view> columns;
    while (reader.next(columns)) {
        Triple triple;
        triple.subject = std::string(columns[0]);
        triple.relation = std::string(columns[1]);
        triple.object = std::string(columns[2]);
        triples.push_back(std::move(triple));
    }
    return triples;
}

std::vector<std::string> TailSampler::find_tail_entities(const std::vector<Triple>& triples,
                                                         uint64_t max_frequency) {
    FrequencyCounter<std::string> counter;
    for (const auto& triple : triples) {
        counter.add(triple.subject);
        counter.add(triple.object);
    }

    std::vector<std::string> tail;
    for (const auto& [entity, count] : counter.entries()) {
        if (count <= max_frequency) {
            tail.push_back(entity);
        }
    }
    return tail;
}

std::vector<Triple> TailSampler::sample_tail_triples(const std::vector<Triple>& triples,
                                                     const std::vector<std::string>& tail_entities,
                                                     size_t sample_size,
                                                     std::mt19937_64& rng) {
    const std::unordered_set<std::string> tail(tail_entities.begin(), tail_entities.end());

    std::vector<Triple> candidates;
    for (const auto& triple : triples) {
        if (tail.count(triple.subject) || tail.count(triple.object)) {
            candidates.push_back(triple);
        }
    }

    if (candidates.size() <= sample_size) {
        return candidates;
    }

    // Selection sampling keeps the relative order of the input
    std::vector<Triple> samples;
    samples.reserve(sample_size);
    std::sample(candidates.begin(), candidates.end(), std::back_inserter(samples),
                sample_size, rng);
    return samples;
}

std::mt19937_64 TailSampler::make_engine(const std::optional<uint64_t>& seed) {
    if (seed) {
        return std::mt19937_64(*seed);
    }
    std::random_device device;
    return std::mt19937_64((static_cast<uint64_t>(device()) << 32) | device());
}

} // namespace tkgstats
