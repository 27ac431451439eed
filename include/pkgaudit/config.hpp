#pragma once

/**
 * @file config.hpp
 * @brief Scan configuration (limits, score overrides, rule parameters)
 */

#include "pkgaudit/common.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace pkgaudit {

class Config
{
public:
    /// Default archive member size limit (4 GiB)
    static constexpr std::uint64_t kDefaultMaxArchiveSize = 4ULL * 1024 * 1024 * 1024;
    static constexpr int kDefaultMaxDepth = 3;
    static constexpr int kDefaultMinKeySize = 2048;
    static constexpr int kDefaultTraversalDepth = 256;
    static constexpr int kDefaultTraversalPasses = 8;

    /// Built-in defaults
    Config();

    /**
     * Build a configuration from an already validated JSON document.
     * Missing keys keep their defaults.
     */
    [[nodiscard]] static pkgaudit::Result<Config> from_json(const nlohmann::json& doc);

    /**
     * Read a configuration file and validate it against config.v1.schema.json.
     */
    [[nodiscard]] static pkgaudit::Result<Config> load(const std::filesystem::path& path,
                                                       const std::filesystem::path& schema_dir);

    /// Largest archive member that may be extracted; nullopt means no limit
    [[nodiscard]] std::optional<std::uint64_t> maximum_archive_size() const noexcept
    {
        return m_max_archive_size;
    }

    /// Configured score for a named detection, or the caller's default
    [[nodiscard]] int score_or_default(std::string_view name, int default_score) const;

    /// Minimum safe key size for a key family ("rsa", "dsa")
    [[nodiscard]] int min_key_size(std::string_view family) const;

    [[nodiscard]] const std::string& log_level() const noexcept { return m_log_level; }
    [[nodiscard]] int min_score() const noexcept { return m_min_score; }
    [[nodiscard]] int max_depth() const noexcept { return m_max_depth; }
    [[nodiscard]] const std::string& tree_suffix() const noexcept { return m_tree_suffix; }
    [[nodiscard]] int traversal_max_depth() const noexcept { return m_traversal_max_depth; }
    [[nodiscard]] int traversal_max_passes() const noexcept { return m_traversal_max_passes; }

    void set_maximum_archive_size(std::optional<std::uint64_t> limit) noexcept
    {
        m_max_archive_size = limit;
    }
    void set_log_level(std::string level) { m_log_level = std::move(level); }

private:
    std::string m_log_level = "warning";
    int m_min_score = 0;
    int m_max_depth = kDefaultMaxDepth;
    std::optional<std::uint64_t> m_max_archive_size = kDefaultMaxArchiveSize;
    std::map<std::string, int, std::less<>> m_scores;
    std::map<std::string, int, std::less<>> m_min_key_sizes;
    std::string m_tree_suffix = ".ast.json";
    int m_traversal_max_depth = kDefaultTraversalDepth;
    int m_traversal_max_passes = kDefaultTraversalPasses;
};

}  // namespace pkgaudit
