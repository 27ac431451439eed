/**
 * @file content_type.cpp
 * @brief Magic-byte content sniffing
 */

#include "pkgaudit/scan/content_type.hpp"

#include <array>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <vector>

namespace pkgaudit::scan {

namespace {

/// ustar magic lives at offset 257 of the first header block
constexpr std::size_t kTarMagicOffset = 257;
constexpr std::size_t kSniffLength = 512;

[[nodiscard]] std::vector<std::uint8_t> read_magic_bytes(const std::filesystem::path& path,
                                                         std::size_t count)
{
    std::ifstream file(path, std::ios::binary);
    std::vector<std::uint8_t> bytes(count);
    if (file.is_open()) {
        file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(count));
        bytes.resize(static_cast<std::size_t>(file.gcount()));
    } else {
        bytes.clear();
    }
    return bytes;
}

template <std::size_t N>
[[nodiscard]] bool starts_with(const std::vector<std::uint8_t>& bytes,
                               const std::array<std::uint8_t, N>& magic,
                               std::size_t offset = 0)
{
    if (bytes.size() < offset + N) {
        return false;
    }
    for (std::size_t i = 0; i < N; ++i) {
        if (bytes[offset + i] != magic[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string detect_mime(const std::filesystem::path& path)
{
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return std::string(kMimeDirectory);
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::string(kMimeOctetStream);
    }

    const auto magic = read_magic_bytes(path, kSniffLength);
    if (starts_with(magic, std::array<std::uint8_t, 2>{0x1F, 0x8B})) {
        return std::string(kMimeGzip);
    }
    if (starts_with(magic, std::array<std::uint8_t, 3>{'B', 'Z', 'h'})) {
        return std::string(kMimeBzip2);
    }
    // Local file header, empty archive, spanned archive
    if (starts_with(magic, std::array<std::uint8_t, 4>{'P', 'K', 0x03, 0x04})
        || starts_with(magic, std::array<std::uint8_t, 4>{'P', 'K', 0x05, 0x06})
        || starts_with(magic, std::array<std::uint8_t, 4>{'P', 'K', 0x07, 0x08})) {
        return std::string(kMimeZip);
    }
    if (starts_with(magic, std::array<std::uint8_t, 5>{'u', 's', 't', 'a', 'r'}, kTarMagicOffset)) {
        return std::string(kMimeTar);
    }
    return std::string(kMimeOctetStream);
}

ArchiveFormat archive_format(std::string_view mime) noexcept
{
    if (mime == kMimeGzip || mime == kMimeXGzip) {
        return ArchiveFormat::kGzipTar;
    }
    if (mime == kMimeBzip2) {
        return ArchiveFormat::kBzip2Tar;
    }
    if (mime == kMimeZip) {
        return ArchiveFormat::kZip;
    }
    return ArchiveFormat::kUnsupported;
}

}  // namespace pkgaudit::scan
