#pragma once

/**
 * @file content_type.hpp
 * @brief Content-type detection of scan locations by magic bytes
 */

#include <filesystem>
#include <string>
#include <string_view>

namespace pkgaudit::scan {

inline constexpr std::string_view kMimeDirectory = "inode/directory";
inline constexpr std::string_view kMimeGzip = "application/gzip";
inline constexpr std::string_view kMimeXGzip = "application/x-gzip";
inline constexpr std::string_view kMimeBzip2 = "application/x-bzip2";
inline constexpr std::string_view kMimeZip = "application/zip";
inline constexpr std::string_view kMimeTar = "application/x-tar";
inline constexpr std::string_view kMimeOctetStream = "application/octet-stream";

enum class ArchiveFormat {
    kGzipTar,
    kBzip2Tar,
    kZip,
    kUnsupported
};

/**
 * Detect the content type of a path.
 * Directories are "inode/directory"; unreadable or unrecognized files are
 * "application/octet-stream".
 */
[[nodiscard]] std::string detect_mime(const std::filesystem::path& path);

/// Archive container handled for a content type
[[nodiscard]] ArchiveFormat archive_format(std::string_view mime) noexcept;

[[nodiscard]] inline bool is_supported_archive(std::string_view mime) noexcept
{
    return archive_format(mime) != ArchiveFormat::kUnsupported;
}

}  // namespace pkgaudit::scan
