/**
 * @file config.cpp
 * @brief Configuration loading and lookups
 */

#include "pkgaudit/config.hpp"

#include "pkgaudit/schema_validate.hpp"

#include <exception>
#include <fstream>
#include <utility>

namespace pkgaudit {

namespace {

[[nodiscard]] pkgaudit::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open configuration file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "ParseError", "Failed to parse configuration file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

[[nodiscard]] pkgaudit::Result<std::map<std::string, int, std::less<>>>
read_int_map(const nlohmann::json& doc, std::string_view label)
{
    std::map<std::string, int, std::less<>> values;
    if (!doc.is_object()) {
        return std::unexpected(
            Error::make("ConfigInvalid", std::string(label) + " must be an object"));
    }
    for (const auto& [key, value] : doc.items()) {
        if (!value.is_number_integer()) {
            return std::unexpected(Error::make(
                "ConfigInvalid", std::string(label) + "." + key + " must be an integer"));
        }
        values.emplace(key, value.get<int>());
    }
    return values;
}

}  // namespace

Config::Config()
    : m_min_key_sizes{{"rsa", kDefaultMinKeySize}, {"dsa", kDefaultMinKeySize}}
{}

pkgaudit::Result<Config> Config::from_json(const nlohmann::json& doc)
{
    if (!doc.is_object()) {
        return std::unexpected(Error::make("ConfigInvalid", "Configuration must be a JSON object"));
    }

    Config config;
    try {
        if (doc.contains("log_level")) {
            config.m_log_level = doc.at("log_level").get<std::string>();
        }
        if (doc.contains("min_score")) {
            config.m_min_score = doc.at("min_score").get<int>();
        }
        if (doc.contains("max_depth")) {
            config.m_max_depth = doc.at("max_depth").get<int>();
        }
        if (doc.contains("archive") && doc.at("archive").contains("max_size")) {
            const auto& max_size = doc.at("archive").at("max_size");
            if (max_size.is_null()) {
                config.m_max_archive_size.reset();
            } else {
                config.m_max_archive_size = max_size.get<std::uint64_t>();
            }
        }
        if (doc.contains("scores")) {
            auto scores = read_int_map(doc.at("scores"), "scores");
            if (!scores) {
                return std::unexpected(scores.error());
            }
            config.m_scores = std::move(*scores);
        }
        if (doc.contains("crypto") && doc.at("crypto").contains("min_key_sizes")) {
            auto sizes = read_int_map(doc.at("crypto").at("min_key_sizes"), "crypto.min_key_sizes");
            if (!sizes) {
                return std::unexpected(sizes.error());
            }
            for (auto& [family, bits] : *sizes) {
                config.m_min_key_sizes.insert_or_assign(family, bits);
            }
        }
        if (doc.contains("frontend") && doc.at("frontend").contains("tree_suffix")) {
            config.m_tree_suffix = doc.at("frontend").at("tree_suffix").get<std::string>();
        }
        if (doc.contains("traversal")) {
            const auto& traversal = doc.at("traversal");
            if (traversal.contains("max_depth")) {
                config.m_traversal_max_depth = traversal.at("max_depth").get<int>();
            }
            if (traversal.contains("max_passes")) {
                config.m_traversal_max_passes = traversal.at("max_passes").get<int>();
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make("ConfigInvalid", ex.what()));
    }
    return config;
}

pkgaudit::Result<Config> Config::load(const std::filesystem::path& path,
                                      const std::filesystem::path& schema_dir)
{
    auto doc = read_json_file(path);
    if (!doc) {
        return std::unexpected(doc.error());
    }
    const auto schema_path = (schema_dir / "config.v1.schema.json").string();
    if (auto result = common::validate_json(*doc, schema_path); !result) {
        return std::unexpected(Error::make(
            result.error().code, "Configuration schema validation failed: " + result.error().message));
    }
    return from_json(*doc);
}

int Config::score_or_default(std::string_view name, int default_score) const
{
    auto it = m_scores.find(name);
    return it == m_scores.end() ? default_score : it->second;
}

int Config::min_key_size(std::string_view family) const
{
    auto it = m_min_key_sizes.find(family);
    return it == m_min_key_sizes.end() ? 0 : it->second;
}

}  // namespace pkgaudit
