/**
 * @file dataset_source.cpp
 * @brief Implementation of dataset directory discovery
 */

#include "tkgstats/sources/dataset_source.hpp"
#include "tkgstats/core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <system_error>

namespace tkgstats {

namespace fs = std::filesystem;

namespace {

std::string to_lower_ascii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::vector<std::string> DatasetSource::discover_datasets(
    const fs::path& base_dir,
    const std::vector<std::string>& include
) {
    std::vector<std::string> names;

    std::error_code ec;
    if (!fs::is_directory(base_dir, ec)) {
        return names;
    }

    fs::directory_iterator it(base_dir, ec);
    if (ec) {
        throw IoError("Cannot list directory", base_dir);
    }
    for (const auto& entry : it) {
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());

    if (!include.empty()) {
        std::set<std::string> wanted;
        for (const auto& item : include) {
            wanted.insert(to_lower_ascii(item));
        }
        names.erase(
            std::remove_if(names.begin(), names.end(), [&wanted](const std::string& name) {
                return wanted.count(to_lower_ascii(name)) == 0;
            }),
            names.end()
        );
    }

    return names;
}

std::vector<fs::path> DatasetSource::list_split_files(
    const fs::path& dataset_dir,
    const std::string& extension
) {
    std::vector<fs::path> files;

    std::error_code ec;
    fs::directory_iterator it(dataset_dir, ec);
    if (ec) {
        throw IoError("Cannot list directory", dataset_dir);
    }
    for (const auto& entry : it) {
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            continue;
        }
        if (ends_with(entry.path().filename().string(), extension)) {
            files.push_back(entry.path());
        }
    }

    // Sort by file name, the order splits are processed and reported in
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return files;
}

DatasetEntry DatasetSource::make_entry(const fs::path& base_dir, const std::string& name) {
    DatasetEntry entry;
    entry.name = name;
    entry.directory = base_dir / name;
    entry.type = classify_dataset(name);
    return entry;
}

} // namespace tkgstats
