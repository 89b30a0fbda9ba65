#include "tkgstats/processing/label_join.hpp"
#include "tkgstats/core/errors.hpp"
#include "tkgstats/data/triple_reader.hpp"
#include <fstream>
#include <string_view>
#include <vector>

namespace tkgstats {

namespace {

const std::string& lookup(const LabelMapping& mapping, std::string_view id,
                          const std::string& missing_value) {
    auto it = mapping.find(std::string(id));
    return it == mapping.end() ? missing_value : it->second;
}

} // namespace

char LabelJoiner::resolve_delimiter(const std::string& spec) {
    if (spec.size() == 1) {
        return spec[0];
    }

    if (spec.size() == 2 && spec[0] == '\\') {
        switch (spec[1]) {
            case 't':  return '\t';
            case 'n':  return '\n';
            case 'r':  return '\r';
            case 'v':  return '\v';
            case 'f':  return '\f';
            case '0':  return '\0';
            case '\\': return '\\';
            case '\'': return '\'';
            case '"':  return '"';
            default:   break;
        }
    }

    throw ConfigurationError(
        "Delimiter must resolve to a single character, got \"" + spec +
        "\". Use --delimiter '\\t' for tabs.");
}

LabelMapping LabelJoiner::load_mapping(const std::filesystem::path& path, char delimiter) {
    LabelMapping mapping;

    TripleReadOptions opts;
    opts.delimiter = delimiter;
    TripleReader reader(path, opts);

    std::string line;
    std::vector<std::string_view> fields;
    while (reader.next_raw(line)) {
        if (line.empty()) {
            continue;
        }
        TripleReader::split_line(line, delimiter, fields);

        std::string_view key = TripleReader::trim(fields[0]);
        if (key.empty()) {
            continue;
        }
        std::string_view label = fields.size() > 1 ? TripleReader::trim(fields[1]) : std::string_view();
        mapping[std::string(key)] = std::string(label);
    }

    return mapping;
}

std::filesystem::path LabelJoiner::default_output_path(const std::filesystem::path& dataset) {
    std::filesystem::path output = dataset;
    output += ".labeled";
    return output;
}

uint64_t LabelJoiner::attach_labels(const std::filesystem::path& dataset,
                                    const LabelMapping& mapping,
                                    const LabelJoinOptions& opts) {
    const std::filesystem::path output_path =
        opts.output.empty() ? default_output_path(dataset) : opts.output;

    TripleReadOptions read_opts;
    read_opts.delimiter = opts.delimiter;
    TripleReader reader(dataset, read_opts);

    std::ofstream target(output_path, std::ios::binary | std::ios::trunc);
    if (!target.is_open()) {
        throw IoError("Cannot create file", output_path);
    }

    uint64_t rows = 0;
    std::string line;
    std::vector<std::string_view> fields;
    while (reader.next_raw(line)) {
        TripleReader::split_line(line, opts.delimiter, fields);

        if (line.empty() || fields.size() < 3) {
            target << line << '\n';
            ++rows;
            continue;
        }

        target << fields[0] << opts.delimiter
               << fields[1] << opts.delimiter
               << fields[2] << opts.delimiter
               << lookup(mapping, fields[0], opts.missing_value) << opts.delimiter
               << lookup(mapping, fields[2], opts.missing_value);
        for (size_t i = 3; i < fields.size(); ++i) {
            target << opts.delimiter << fields[i];
        }
        target << '\n';
        ++rows;
    }

    target.close();
    if (!target) {
        throw IoError("Failed to write file", output_path);
    }
    return rows;
}

} // namespace tkgstats
