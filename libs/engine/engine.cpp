/**
 * @file engine.cpp
 * @brief Scan and diff drivers
 */

#include "pkgaudit/engine.hpp"

#include "pkgaudit/analyzers/archive.hpp"
#include "pkgaudit/analyzers/source.hpp"
#include "pkgaudit/report.hpp"

#include <memory>
#include <system_error>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

namespace pkgaudit::engine {

namespace {

[[nodiscard]] pkgaudit::VoidResult require_exists(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(Error::make("IOError", "Path does not exist: " + path.string()));
    }
    return {};
}

/// Differential archive mode over the changed entries of one diff level
[[nodiscard]] pkgaudit::VoidResult diff_level(const std::vector<DiffEntry>& entries,
                                              const Config& config,
                                              report::FindingCollector& collector)
{
    for (const auto& entry : entries) {
        auto stream = analyzers::diff_archive(entry, config);
        while (auto output = stream->next()) {
            if (auto* finding = std::get_if<Finding>(&*output)) {
                collector.add(std::move(*finding));
                continue;
            }
            const auto& location = std::get<scan::ScanLocationPtr>(*output);
            if (!location->peer()) {
                continue;
            }
            if (location->depth() > config.max_depth()) {
                spdlog::warn("Maximum depth {} reached, not diffing '{}'",
                             config.max_depth(),
                             location->str());
                continue;
            }
            auto nested = diff_trees(location, location->peer());
            if (!nested) {
                return std::unexpected(nested.error());
            }
            if (auto result = diff_level(*nested, config, collector); !result) {
                return result;
            }
        }
    }
    return {};
}

}  // namespace

std::vector<scan::AnalyzerPtr> make_default_analyzers(const Config& config)
{
    return {std::make_shared<analyzers::ArchiveAnalyzer>(config),
            std::make_shared<analyzers::SourceAnalyzer>(config)};
}

pkgaudit::Result<ScanSummary> scan_path(const std::filesystem::path& path, const Config& config)
{
    if (auto result = require_exists(path); !result) {
        return std::unexpected(result.error());
    }

    scan::Pipeline pipeline(config, make_default_analyzers(config));
    report::FindingCollector collector;
    ScanSummary summary;

    auto stream = pipeline.analyze(scan::ScanLocation::create(path));
    while (auto output = stream->next()) {
        if (auto* finding = std::get_if<Finding>(&*output)) {
            collector.add(std::move(*finding));
        } else {
            ++summary.locations;
        }
    }
    summary.findings = collector.findings();
    spdlog::debug("Scanned '{}': {} findings, {} unpacked locations",
                  path.string(),
                  summary.findings.size(),
                  summary.locations);
    return summary;
}

pkgaudit::Result<DiffSummary> diff_paths(const std::filesystem::path& a,
                                         const std::filesystem::path& b,
                                         const Config& config)
{
    for (const auto* path : {&a, &b}) {
        if (auto result = require_exists(*path); !result) {
            return std::unexpected(result.error());
        }
    }

    auto entries = diff_trees(scan::ScanLocation::create(a), scan::ScanLocation::create(b));
    if (!entries) {
        return std::unexpected(entries.error());
    }

    report::FindingCollector collector;
    if (auto result = diff_level(*entries, config, collector); !result) {
        return std::unexpected(result.error());
    }
    return DiffSummary{.entries = std::move(*entries), .findings = collector.findings()};
}

}  // namespace pkgaudit::engine
