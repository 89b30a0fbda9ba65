#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace tkgstats {

/// Triple file reading options
struct TripleReadOptions {
    char delimiter = '\t';      ///< Column delimiter
    size_t min_columns = 3;     ///< Rows with fewer columns are skipped
};

/// Streaming reader for tab-delimited triple files.
/// The file stays open for the lifetime of the reader and is read one line
/// at a time; nothing beyond the current line is kept in memory.
class TripleReader {
public:
    /// Open a split file (throws IoError if it cannot be opened)
    explicit TripleReader(const std::filesystem::path& path,
                          const TripleReadOptions& opts = TripleReadOptions());

    TripleReader(const TripleReader&) = delete;
    TripleReader& operator=(const TripleReader&) = delete;

    /// Advance to the next accepted row.
    /// Lines are trimmed first; blank lines and rows with fewer than
    /// `min_columns` columns are skipped. The views stay valid until the
    /// next call. Returns false at end of file.
    bool next(std::vector<std::string_view>& columns);

    /// Advance to the next raw line (line terminator removed, nothing
    /// skipped). Returns false at end of file.
    bool next_raw(std::string& line);

    /// Path being read
    const std::filesystem::path& path() const { return path_; }

    /// Physical lines consumed so far
    uint64_t lines_read() const { return lines_read_; }

    /// Non-blank lines rejected for having too few columns
    uint64_t rows_skipped() const { return rows_skipped_; }

    /// Split a line on `delimiter` (empty fields are kept)
    static std::vector<std::string_view> split_line(std::string_view line, char delimiter);

    /// Split into a caller-provided vector to reuse its storage
    static void split_line(std::string_view line, char delimiter,
                           std::vector<std::string_view>& out);

    /// Strip leading/trailing ASCII whitespace (space, \t, \n, \r, \v, \f)
    static std::string_view trim(std::string_view text);

private:
    /// Read one physical line into line_; throws IoError on a stream failure
    bool read_line();

    std::filesystem::path path_;
    TripleReadOptions opts_;
    std::ifstream file_;
    std::string line_;
    uint64_t lines_read_ = 0;
    uint64_t rows_skipped_ = 0;
};

} // namespace tkgstats
