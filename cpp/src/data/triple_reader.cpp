#include "tkgstats/data/triple_reader.hpp"
#include "tkgstats/core/errors.hpp"

namespace tkgstats {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\v\f";

} // namespace

// ===== Public API =====

TripleReader::TripleReader(const std::filesystem::path& path, const TripleReadOptions& opts)
    : path_(path)
    , opts_(opts)
    , file_(path, std::ios::binary)
{
    if (!file_.is_open()) {
        throw IoError("Cannot open file", path_);
    }
}

bool TripleReader::next(std::vector<std::string_view>& columns) {
    while (read_line()) {
        std::string_view line = trim(line_);

        // Skip blank lines
        if (line.empty()) {
            continue;
        }

        split_line(line, opts_.delimiter, columns);

        // Too few columns: the whole row is ignored
        if (columns.size() < opts_.min_columns) {
            ++rows_skipped_;
            continue;
        }
        return true;
    }
    columns.clear();
    return false;
}

bool TripleReader::next_raw(std::string& line) {
    if (!read_line()) {
        return false;
    }
    line = line_;
    return true;
}

// ===== Helpers =====

std::vector<std::string_view> TripleReader::split_line(std::string_view line, char delimiter) {
    std::vector<std::string_view> fields;
    split_line(line, delimiter, fields);
    return fields;
}

void TripleReader::split_line(std::string_view line, char delimiter,
                              std::vector<std::string_view>& out) {
    out.clear();

    size_t start = 0;
    while (true) {
        size_t pos = line.find(delimiter, start);
        if (pos == std::string_view::npos) {
            out.push_back(line.substr(start));
            break;
        }
        out.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string_view TripleReader::trim(std::string_view text) {
    size_t first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    size_t last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

// ===== Internal Methods =====

bool TripleReader::read_line() {
    if (!std::getline(file_, line_)) {
        if (file_.bad()) {
            throw IoError("Failed to read file", path_);
        }
        return false;
    }

    // Tolerate CRLF files
    if (!line_.empty() && line_.back() == '\r') {
        line_.pop_back();
    }
    ++lines_read_;
    return true;
}

} // namespace tkgstats
