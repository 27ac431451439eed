#pragma once

/**
 * @file report.hpp
 * @brief Finding deduplication and scan report documents (report.v1)
 */

#include "pkgaudit/common.hpp"
#include "pkgaudit/diff.hpp"
#include "pkgaudit/finding.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

namespace pkgaudit::report {

/**
 * @brief Keeps the first finding of every signature, in arrival order.
 */
class FindingCollector
{
public:
    /// @return false if a finding with the same signature was already collected
    bool add(Finding finding);

    [[nodiscard]] const std::vector<Finding>& findings() const noexcept { return m_findings; }
    [[nodiscard]] std::size_t size() const noexcept { return m_findings.size(); }

private:
    std::vector<Finding> m_findings;
    std::unordered_set<std::string> m_signatures;
};

struct ReportInput
{
    std::string input;                ///< Scanned path (or "a..b" for a diff)
    std::vector<Finding> findings;
    std::vector<DiffEntry> diff;      ///< Only emitted when non-empty
    int min_score = 0;
};

/**
 * Build a report document. Findings below min_score are dropped and the
 * rest are sorted by signature.
 */
[[nodiscard]] nlohmann::ordered_json build_report(const ReportInput& input);

/**
 * Validate a report against report.v1.schema.json and write it.
 * An empty output path writes to stdout.
 */
[[nodiscard]] pkgaudit::VoidResult write_report(const nlohmann::ordered_json& report,
                                                const std::filesystem::path& output,
                                                const std::filesystem::path& schema_dir);

}  // namespace pkgaudit::report
