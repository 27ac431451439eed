#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error results, hashing, path normalization
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pkgaudit {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success
 */
using VoidResult = std::expected<void, Error>;

}  // namespace pkgaudit

namespace pkgaudit::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

/**
 * Compute SHA-256 hash of data
 * @param data Input bytes
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * Compute SHA-256 hash of a file's content, streaming it in blocks
 * @param path File to hash
 * @return Hex-encoded hash string or IOError
 */
[[nodiscard]] pkgaudit::Result<std::string> sha256_file(const std::filesystem::path& path);

// ============================================================================
// Path Normalization
// ============================================================================

/**
 * Normalize a path for deterministic output
 * - Use '/' as separator
 * - Remove trailing slashes
 * - Resolve '..' and '.'
 *
 * @param input Input path
 * @return Normalized path
 */
[[nodiscard]] std::string normalize_path(std::string_view input);

/**
 * Check if path starts at a filesystem root (POSIX root, drive root or UNC)
 */
[[nodiscard]] bool is_absolute_path(std::string_view path);

/**
 * Split a path into its non-empty components. Both '/' and '\\' separate.
 */
[[nodiscard]] std::vector<std::string> path_parts(std::string_view path);

/**
 * Check whether any component of the path is exactly ".."
 */
[[nodiscard]] bool has_parent_reference(std::string_view path);

}  // namespace pkgaudit::common
