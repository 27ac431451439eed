#pragma once

/**
 * @file diff.hpp
 * @brief File-level differences between two scan roots
 */

#include "pkgaudit/common.hpp"
#include "pkgaudit/scan/location.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace pkgaudit {

enum class DiffOperation : char {
    kAdded = 'A',     ///< Only in b
    kDeleted = 'D',   ///< Only in a
    kModified = 'M',  ///< Same relative path, different content
    kRenamed = 'R'    ///< Same content under a different relative path
};

[[nodiscard]] char to_char(DiffOperation operation) noexcept;

struct DiffEntry
{
    DiffOperation operation = DiffOperation::kModified;
    std::filesystem::path a_path;  ///< Empty for kAdded
    std::filesystem::path b_path;  ///< Empty for kDeleted
    std::string a_sha256;
    std::string b_sha256;
    scan::ScanLocationPtr a_scan;  ///< Root a_path was found under
    scan::ScanLocationPtr b_scan;  ///< Root b_path was found under

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * Compare the regular files below two locations (or two single files).
 *
 * Files are matched by path relative to their root. Unmatched files whose
 * content appears exactly once on the other side are paired as renames.
 * Entries are ordered by operation, then by path.
 *
 * @return Entries or IOError if a file cannot be hashed
 */
[[nodiscard]] pkgaudit::Result<std::vector<DiffEntry>> diff_trees(const scan::ScanLocationPtr& a,
                                                                  const scan::ScanLocationPtr& b);

}  // namespace pkgaudit
