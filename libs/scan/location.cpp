/**
 * @file location.cpp
 * @brief Scan location hierarchy and temporary workspace ownership
 */

#include "pkgaudit/scan/location.hpp"

#include "pkgaudit/scan/content_type.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include <stdlib.h>  // mkdtemp

namespace pkgaudit::scan {

namespace {

constexpr char kArchiveSeparator = '$';

}  // namespace

pkgaudit::Result<std::shared_ptr<TemporaryDirectory>> TemporaryDirectory::create(std::string_view prefix,
                                                                                 std::string_view suffix)
{
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return std::unexpected(
            Error::make("IOError", "No temporary directory available: " + ec.message()));
    }

    // mkdtemp requires the template to end in XXXXXX; the suffix is added by renaming
    std::string pattern = (base / (std::string(prefix) + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        return std::unexpected(Error::make(
            "IOError", "Failed to create temporary directory: " + std::string(std::strerror(errno))));
    }
    std::filesystem::path created(buffer.data());
    if (!suffix.empty()) {
        auto renamed = created;
        renamed += std::string(suffix);
        std::filesystem::rename(created, renamed, ec);
        if (ec) {
            std::filesystem::remove_all(created, ec);
            return std::unexpected(Error::make(
                "IOError", "Failed to name temporary directory: " + renamed.string()));
        }
        created = std::move(renamed);
    }
    return std::make_shared<TemporaryDirectory>(Token{}, std::move(created));
}

TemporaryDirectory::TemporaryDirectory(Token, std::filesystem::path path)
    : m_path(std::move(path))
{}

TemporaryDirectory::~TemporaryDirectory()
{
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
    if (ec) {
        spdlog::warn("Failed to remove temporary directory '{}': {}", m_path.string(), ec.message());
    } else {
        spdlog::debug("Removed temporary directory '{}'", m_path.string());
    }
}

ScanLocation::ScanLocation(Token, std::filesystem::path path, LocationMetadata metadata)
    : m_path(std::move(path))
    , m_display(m_path.string())
    , m_metadata(std::move(metadata))
{}

ScanLocationPtr ScanLocation::create(std::filesystem::path path)
{
    LocationMetadata metadata{.mime = detect_mime(path)};
    return create(std::move(path), std::move(metadata));
}

ScanLocationPtr ScanLocation::create(std::filesystem::path path, LocationMetadata metadata)
{
    if (metadata.mime.empty()) {
        metadata.mime = detect_mime(path);
    }
    return std::make_shared<ScanLocation>(Token{}, std::move(path), std::move(metadata));
}

ScanLocationPtr ScanLocation::create_child(std::filesystem::path path) const
{
    auto child = create(std::move(path));
    if (m_workspace) {
        auto relative = child->m_path.lexically_relative(m_workspace->path());
        if (!relative.empty()) {
            child->m_display = m_archive_display + kArchiveSeparator + relative.generic_string();
        }
        child->m_archive_display = m_archive_display;
    }
    child->m_parent = weak_from_this();
    child->m_depth = m_depth;
    child->m_workspace = m_workspace;
    return child;
}

ScanLocationPtr ScanLocation::create_child(std::shared_ptr<TemporaryDirectory> workspace) const
{
    auto child = create(workspace->path(), LocationMetadata{.mime = std::string(kMimeDirectory)});
    child->m_display = m_display + kArchiveSeparator;
    child->m_archive_display = m_display;
    child->m_parent = weak_from_this();
    child->m_depth = m_depth + 1;
    child->m_cleanup = true;
    child->m_workspace = std::move(workspace);
    return child;
}

bool ScanLocation::is_directory() const
{
    return m_metadata.mime == kMimeDirectory;
}

}  // namespace pkgaudit::scan
