#pragma once

/**
 * @file pipeline.hpp
 * @brief Pull-based recursive analysis of scan locations
 */

#include "pkgaudit/config.hpp"
#include "pkgaudit/finding.hpp"
#include "pkgaudit/scan/location.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace pkgaudit::scan {

/// Analyzer output: a detection or a new location to scan
using ScanOutput = std::variant<Finding, ScanLocationPtr>;

/**
 * @brief Lazy sequence of analyzer outputs.
 *
 * next() does only the work needed to produce the following item. Destroying
 * a stream early releases everything it holds.
 */
class OutputStream
{
public:
    virtual ~OutputStream() = default;

    /// Next item, or nullopt once the stream is exhausted
    [[nodiscard]] virtual std::optional<ScanOutput> next() = 0;
};

using OutputStreamPtr = std::unique_ptr<OutputStream>;

/**
 * @brief Stream over outputs computed up front.
 */
class VectorStream final : public OutputStream
{
public:
    VectorStream() = default;
    explicit VectorStream(std::vector<ScanOutput> items);

    [[nodiscard]] std::optional<ScanOutput> next() override;

private:
    std::vector<ScanOutput> m_items;
    std::size_t m_next = 0;
};

class Analyzer
{
public:
    virtual ~Analyzer() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    /// Outputs for one location; an empty stream if the location is not handled
    [[nodiscard]] virtual OutputStreamPtr analyze(const ScanLocationPtr& location) = 0;
};

using AnalyzerPtr = std::shared_ptr<Analyzer>;

/**
 * @brief FIFO scheduler of locations across registered analyzers.
 *
 * Directory locations are expanded into one location per regular file below
 * them. Locations produced by analyzers are passed to the consumer and, unless
 * deeper than Config::max_depth(), queued for analysis.
 */
class Pipeline
{
public:
    Pipeline(const Config& config, std::vector<AnalyzerPtr> analyzers);

    /// Lazily analyze a location and everything discovered from it
    [[nodiscard]] OutputStreamPtr analyze(ScanLocationPtr root) const;

    /// Drain analyze() into a vector
    [[nodiscard]] std::vector<ScanOutput> collect(ScanLocationPtr root) const;

private:
    const Config& m_config;
    std::vector<AnalyzerPtr> m_analyzers;
};

/// Regular files below a directory in sorted path order; symbolic links are not followed
[[nodiscard]] std::vector<std::filesystem::path> list_regular_files(const std::filesystem::path& directory);

}  // namespace pkgaudit::scan
