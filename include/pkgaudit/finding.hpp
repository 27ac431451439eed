#pragma once

/**
 * @file finding.hpp
 * @brief Detection records ("hits") produced by analyzers
 */

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace pkgaudit {

/// Score assigned to the most severe findings
constexpr int kMaxScore = 100;

/**
 * @brief One detection.
 *
 * Findings are compared and hashed by their signature only: the same
 * condition at the same location always collapses to one finding.
 */
class Finding
{
public:
    struct Fields
    {
        std::string type;       ///< Rule name, e.g. "SuspiciousArchiveEntry"
        std::string location;   ///< Path of the scanned artifact
        std::string message;    ///< Human-readable description
        std::string signature;  ///< Deduplication key
        int score = 0;
        nlohmann::ordered_json extra = nlohmann::ordered_json::object();
        std::optional<int> line_no;
    };

    explicit Finding(Fields fields);

    [[nodiscard]] const std::string& type() const noexcept { return m_fields.type; }
    [[nodiscard]] const std::string& location() const noexcept { return m_fields.location; }
    [[nodiscard]] const std::string& message() const noexcept { return m_fields.message; }
    [[nodiscard]] const std::string& signature() const noexcept { return m_fields.signature; }
    [[nodiscard]] int score() const noexcept { return m_fields.score; }
    [[nodiscard]] const nlohmann::ordered_json& extra() const noexcept { return m_fields.extra; }
    [[nodiscard]] std::optional<int> line_no() const noexcept { return m_fields.line_no; }

    /// Structured form used by reports
    [[nodiscard]] nlohmann::ordered_json to_json() const;

    friend bool operator==(const Finding& lhs, const Finding& rhs) noexcept
    {
        return lhs.signature() == rhs.signature();
    }

private:
    Fields m_fields;
};

/**
 * Build a deduplication key "<kind>#<subkind>#<discriminator>#...".
 */
[[nodiscard]] std::string make_signature(std::initializer_list<std::string_view> parts);

}  // namespace pkgaudit

template <>
struct std::hash<pkgaudit::Finding>
{
    std::size_t operator()(const pkgaudit::Finding& finding) const noexcept
    {
        return std::hash<std::string>{}(finding.signature());
    }
};
