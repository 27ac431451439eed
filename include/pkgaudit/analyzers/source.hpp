#pragma once

/**
 * @file source.hpp
 * @brief Source analyzer: parse, rewrite to a fixed point, run detection rules
 */

#include "pkgaudit/ast/loader.hpp"
#include "pkgaudit/ast/visitor.hpp"
#include "pkgaudit/config.hpp"
#include "pkgaudit/scan/pipeline.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pkgaudit::analyzers {

/**
 * @brief Produces a node tree for the locations it accepts.
 */
class Frontend
{
public:
    virtual ~Frontend() = default;

    [[nodiscard]] virtual bool accepts(const scan::ScanLocation& location) const = 0;
    [[nodiscard]] virtual pkgaudit::Result<ast::ParsedSource>
    parse(const scan::ScanLocation& location) const = 0;
};

/**
 * @brief Reads primitive trees serialized by an external parser.
 */
class JsonTreeFrontend final : public Frontend
{
public:
    explicit JsonTreeFrontend(std::string suffix);

    [[nodiscard]] bool accepts(const scan::ScanLocation& location) const override;
    [[nodiscard]] pkgaudit::Result<ast::ParsedSource>
    parse(const scan::ScanLocation& location) const override;

private:
    std::string m_suffix;
};

class SourceAnalyzer final : public scan::Analyzer
{
public:
    /// Detection rules default to the built-in catalogue
    explicit SourceAnalyzer(const Config& config);
    SourceAnalyzer(const Config& config,
                   std::unique_ptr<Frontend> frontend,
                   std::vector<ast::RulePtr> detection_rules);

    [[nodiscard]] std::string_view name() const override { return "source"; }
    [[nodiscard]] scan::OutputStreamPtr analyze(const scan::ScanLocationPtr& location) override;

private:
    const Config& m_config;
    std::shared_ptr<const Frontend> m_frontend;
    std::vector<ast::RulePtr> m_detection_rules;
};

/// Built-in detection rules
[[nodiscard]] std::vector<ast::RulePtr> make_detection_rules(const Config& config);

}  // namespace pkgaudit::analyzers
