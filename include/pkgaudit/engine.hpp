#pragma once

/**
 * @file engine.hpp
 * @brief Whole-run drivers for the scan and diff commands
 */

#include "pkgaudit/common.hpp"
#include "pkgaudit/config.hpp"
#include "pkgaudit/diff.hpp"
#include "pkgaudit/finding.hpp"
#include "pkgaudit/scan/pipeline.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace pkgaudit::engine {

struct ScanSummary
{
    std::vector<Finding> findings;  ///< Deduplicated by signature, in discovery order
    std::size_t locations = 0;      ///< Locations produced by analyzers
};

struct DiffSummary
{
    std::vector<DiffEntry> entries;  ///< Differences between the two roots
    std::vector<Finding> findings;   ///< Differential archive findings at every depth
};

/// Archive and source analyzers bound to a configuration
[[nodiscard]] std::vector<scan::AnalyzerPtr> make_default_analyzers(const Config& config);

/**
 * Scan a file or directory and everything unpacked from it.
 *
 * @return Findings or IOError if the path does not exist
 */
[[nodiscard]] pkgaudit::Result<ScanSummary> scan_path(const std::filesystem::path& path,
                                                      const Config& config);

/**
 * Diff two roots. Modified and renamed pairs run through the differential
 * archive mode; unpacked pairs are diffed again, up to Config::max_depth().
 */
[[nodiscard]] pkgaudit::Result<DiffSummary> diff_paths(const std::filesystem::path& a,
                                                       const std::filesystem::path& b,
                                                       const Config& config);

}  // namespace pkgaudit::engine
