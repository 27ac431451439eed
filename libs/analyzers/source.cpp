/**
 * @file source.cpp
 * @brief Source tree analysis
 */

#include "pkgaudit/analyzers/source.hpp"

#include "pkgaudit/rules/crypto.hpp"
#include "pkgaudit/rules/rewrite.hpp"

#include <filesystem>
#include <utility>

#include <spdlog/spdlog.h>

namespace pkgaudit::analyzers {

namespace {

[[nodiscard]] Finding parse_error(const Config& config,
                                  const scan::ScanLocation& location,
                                  const Error& error)
{
    nlohmann::ordered_json extra = nlohmann::ordered_json::object();
    extra["reason"] = "ast_parse_error";
    extra["exc_message"] = error.message;
    extra["exc_type"] = error.code;

    return Finding(Finding::Fields{
        .type = "ASTParseError",
        .location = location.str(),
        .message = "Unable to parse the source code",
        .signature = make_signature({"ast_parse_error", location.str()}),
        .score = config.score_or_default("ast-parse-error", 0),
        .extra = std::move(extra),
    });
}

/**
 * Parsing and rewriting happen on the first next(); detection findings are
 * then produced one traversal step at a time.
 */
class SourceStream final : public scan::OutputStream
{
public:
    SourceStream(const Config& config,
                 std::shared_ptr<const Frontend> frontend,
                 std::vector<ast::RulePtr> detection_rules,
                 scan::ScanLocationPtr location)
        : m_config(config)
        , m_frontend(std::move(frontend))
        , m_detection_rules(std::move(detection_rules))
        , m_location(std::move(location))
    {}

    [[nodiscard]] std::optional<scan::ScanOutput> next() override
    {
        if (!m_started) {
            m_started = true;
            if (auto failure = prepare()) {
                return failure;
            }
        }
        if (!m_traversal) {
            return std::nullopt;
        }
        if (auto finding = m_traversal->next_finding()) {
            return std::move(*finding);
        }
        m_traversal.reset();
        return std::nullopt;
    }

private:
    /// Parse and rewrite; a Finding if the tree cannot be loaded
    [[nodiscard]] std::optional<scan::ScanOutput> prepare()
    {
        auto parsed = m_frontend->parse(*m_location);
        if (!parsed) {
            spdlog::debug("Failed to parse '{}': {}", m_location->str(), parsed.error().message);
            return parse_error(m_config, *m_location, parsed.error());
        }

        // Findings name the display path, not the extraction directory
        const std::filesystem::path display(m_location->str());
        auto rewritten = ast::run_to_fixed_point(parsed->root,
                                                 display,
                                                 rules::make_rewrite_rules(),
                                                 m_config.traversal_max_depth(),
                                                 m_config.traversal_max_passes());
        if (!rewritten.converged) {
            spdlog::warn("Rewriting '{}' did not converge after {} passes",
                         m_location->str(),
                         rewritten.passes);
        }
        m_traversal = std::make_unique<ast::Traversal>(std::move(rewritten.root),
                                                       display,
                                                       m_detection_rules,
                                                       m_config.traversal_max_depth());
        return std::nullopt;
    }

    const Config& m_config;
    std::shared_ptr<const Frontend> m_frontend;
    std::vector<ast::RulePtr> m_detection_rules;
    scan::ScanLocationPtr m_location;
    std::unique_ptr<ast::Traversal> m_traversal;
    bool m_started = false;
};

}  // namespace

JsonTreeFrontend::JsonTreeFrontend(std::string suffix)
    : m_suffix(std::move(suffix))
{}

bool JsonTreeFrontend::accepts(const scan::ScanLocation& location) const
{
    return !location.is_directory() && location.path().filename().string().ends_with(m_suffix);
}

pkgaudit::Result<ast::ParsedSource> JsonTreeFrontend::parse(const scan::ScanLocation& location) const
{
    return ast::load_tree_file(location.path());
}

SourceAnalyzer::SourceAnalyzer(const Config& config)
    : SourceAnalyzer(config,
                     std::make_unique<JsonTreeFrontend>(config.tree_suffix()),
                     make_detection_rules(config))
{}

SourceAnalyzer::SourceAnalyzer(const Config& config,
                               std::unique_ptr<Frontend> frontend,
                               std::vector<ast::RulePtr> detection_rules)
    : m_config(config)
    , m_frontend(std::move(frontend))
    , m_detection_rules(std::move(detection_rules))
{}

scan::OutputStreamPtr SourceAnalyzer::analyze(const scan::ScanLocationPtr& location)
{
    if (!m_frontend->accepts(*location)) {
        return std::make_unique<scan::VectorStream>();
    }
    return std::make_unique<SourceStream>(m_config, m_frontend, m_detection_rules, location);
}

std::vector<ast::RulePtr> make_detection_rules(const Config& config)
{
    return {std::make_shared<rules::CryptoGenKey>(config)};
}

}  // namespace pkgaudit::analyzers
