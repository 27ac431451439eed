/**
 * @file report.cpp
 * @brief Report assembly, validation and output
 */

#include "pkgaudit/report.hpp"

#include "pkgaudit/schema_validate.hpp"
#include "pkgaudit/version.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <utility>

namespace pkgaudit::report {

bool FindingCollector::add(Finding finding)
{
    if (!m_signatures.insert(finding.signature()).second) {
        return false;
    }
    m_findings.push_back(std::move(finding));
    return true;
}

nlohmann::ordered_json build_report(const ReportInput& input)
{
    std::vector<const Finding*> selected;
    for (const auto& finding : input.findings) {
        if (finding.score() >= input.min_score) {
            selected.push_back(&finding);
        }
    }
    std::ranges::sort(selected, [](const Finding* lhs, const Finding* rhs) {
        return lhs->signature() < rhs->signature();
    });

    nlohmann::ordered_json findings = nlohmann::ordered_json::array();
    for (const auto* finding : selected) {
        findings.push_back(finding->to_json());
    }

    nlohmann::ordered_json report = {
        {"schema_version", kReportSchemaVersion},
        {          "tool", {{"name", "pkgaudit"}, {"version", kVersion}, {"build_id", kBuildId}}},
        {         "input", input.input},
        {      "findings", std::move(findings)}
    };
    if (!input.diff.empty()) {
        nlohmann::ordered_json diff = nlohmann::ordered_json::array();
        for (const auto& entry : input.diff) {
            diff.push_back(nlohmann::ordered_json::parse(entry.to_json().dump()));
        }
        report["diff"] = std::move(diff);
    }
    return report;
}

pkgaudit::VoidResult write_report(const nlohmann::ordered_json& report,
                                  const std::filesystem::path& output,
                                  const std::filesystem::path& schema_dir)
{
    const auto text = report.dump(2);
    const auto schema_path = (schema_dir / "report.v1.schema.json").string();
    if (auto result = common::validate_json(nlohmann::json::parse(text), schema_path); !result) {
        return std::unexpected(result.error());
    }

    if (output.empty()) {
        std::cout << text << '\n';
        return {};
    }
    std::ofstream out(output);
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to open output file: " + output.string()));
    }
    out << text << '\n';
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to write output file: " + output.string()));
    }
    return {};
}

}  // namespace pkgaudit::report
