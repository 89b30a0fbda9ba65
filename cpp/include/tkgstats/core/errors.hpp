#pragma once

/**
 * @file errors.hpp
 * @brief Fatal error types raised by the tkgstats engine and tools
 *
 * Per-line parse problems are never exceptions: they surface as empty
 * optionals from the extractor and the offending contribution is skipped.
 */

#include <filesystem>
#include <stdexcept>
#include <string>

namespace tkgstats {

/// Bad input selection or options (missing base directory, empty dataset
/// selection, empty label mapping, invalid delimiter, ...)
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Unreadable input or unwritable output; the message names the path
class IoError : public std::runtime_error {
public:
    IoError(const std::string& message, const std::filesystem::path& path)
        : std::runtime_error(message + ": " + path.string())
        , path_(path)
    {}

    /// Path responsible for the failure
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace tkgstats
