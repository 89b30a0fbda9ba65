#pragma once

/**
 * @file dataset_source.hpp
 * @brief Discovery of dataset directories and their split files
 *
 * A dataset is an immediate subdirectory of a base directory; its splits
 * are the regular files in it that carry a fixed extension.
 */

#include "tkgstats/data/dataset_type.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace tkgstats {

/**
 * @brief One selected dataset directory
 */
struct DatasetEntry {
    std::string name;                   ///< Directory name
    std::filesystem::path directory;    ///< Full path
    DatasetType type;                   ///< Convention, classified once

    DatasetEntry() : type(DatasetType::GENERIC) {}
};

class DatasetSource {
public:
    DatasetSource() = delete;  // Static class, no instances

    /**
     * @brief List dataset directory names under `base_dir`
     *
     * Names are sorted; when `include` is non-empty only names equal to one
     * of its entries (ignoring ASCII case) are kept. A missing or
     * non-directory `base_dir` yields an empty list.
     *
     * @throws IoError if the directory exists but cannot be listed
     */
    static std::vector<std::string> discover_datasets(
        const std::filesystem::path& base_dir,
        const std::vector<std::string>& include
    );

    /**
     * @brief Sorted split files of a dataset directory with `extension`
     *
     * Every non-directory entry with the extension is a split, so an
     * entry that cannot be opened surfaces as an IoError when it is read.
     *
     * @throws IoError if the directory cannot be listed
     */
    static std::vector<std::filesystem::path> list_split_files(
        const std::filesystem::path& dataset_dir,
        const std::string& extension
    );

    /// Build the entry of a dataset (classifies its convention)
    static DatasetEntry make_entry(const std::filesystem::path& base_dir,
                                   const std::string& name);
};

} // namespace tkgstats
