/**
 * @file path.cpp
 * @brief Path normalization and archive entry path inspection
 */

#include "pkgaudit/common.hpp"

#include <algorithm>
#include <cctype>
#include <ranges>
#include <string>
#include <vector>

namespace pkgaudit::common {

namespace {

struct PrefixInfo
{
    std::string prefix;
    std::size_t start;
};

[[nodiscard]] PrefixInfo extract_prefix(std::string_view path)
{
    PrefixInfo info{.prefix = std::string{}, .start = 0};
    if (path.size() >= 2 && path[1] == ':') {
        info.prefix = std::string(1, static_cast<char>(std::tolower(path[0]))) + ":";
        info.start = 2;
        return info;
    }
    return info;
}

[[nodiscard]] std::vector<std::string> resolve_parts(const std::vector<std::string>& parts,
                                                     bool absolute_input)
{
    std::vector<std::string> resolved;
    for (const auto& part : parts) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!resolved.empty() && resolved.back() != "..") {
                resolved.pop_back();
                continue;
            }
            if (!absolute_input) {
                resolved.emplace_back("..");
            }
            continue;
        }
        resolved.push_back(part);
    }
    return resolved;
}

[[nodiscard]] std::string join_path(const std::vector<std::string>& parts)
{
    std::string result;
    for (auto [i, part] : std::views::enumerate(parts)) {
        if (i > 0) {
            result += '/';
        }
        result += part;
    }
    return result;
}

}  // namespace

std::vector<std::string> path_parts(std::string_view path)
{
    std::vector<std::string> parts;
    for (auto part : path | std::views::split('/')) {
        std::string_view sv(part.begin(), part.end());
        for (auto sub : sv | std::views::split('\\')) {
            std::string_view sub_sv(sub.begin(), sub.end());
            if (!sub_sv.empty()) {
                parts.emplace_back(sub_sv);
            }
        }
    }
    return parts;
}

bool has_parent_reference(std::string_view path)
{
    return std::ranges::any_of(path_parts(path), [](const std::string& part) {
        return part == "..";
    });
}

bool is_absolute_path(std::string_view path)
{
    if (path.empty()) {
        return false;
    }

    // Unix absolute path
    if (path[0] == '/') {
        return true;
    }

    // Windows absolute path (C:\ or C:/)
    if (path.size() >= 3 && std::isalpha(static_cast<unsigned char>(path[0])) != 0
        && path[1] == ':' && (path[2] == '/' || path[2] == '\\')) {
        return true;
    }

    // UNC path
    return path.size() >= 2 && path[0] == '\\' && path[1] == '\\';
}

std::string normalize_path(std::string_view input)
{
    if (input.empty()) {
        return ".";
    }
    std::string path(input);
    std::ranges::replace(path, '\\', '/');

    const PrefixInfo prefix_info = extract_prefix(path);
    const bool absolute_input = is_absolute_path(input);

    auto resolved = resolve_parts(path_parts(std::string_view(path).substr(prefix_info.start)),
                                  absolute_input);
    std::string normalized = join_path(resolved);

    if (!prefix_info.prefix.empty()) {
        normalized = prefix_info.prefix + "/" + normalized;
    } else if (absolute_input) {
        normalized = "/" + normalized;
    }
    return normalized.empty() ? "." : normalized;
}

}  // namespace pkgaudit::common
