#pragma once

/**
 * @file location.hpp
 * @brief Scan locations and owned temporary workspaces
 */

#include "pkgaudit/common.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace pkgaudit::scan {

/**
 * @brief Temporary directory removed when the last owner releases it.
 */
class TemporaryDirectory
{
public:
    /**
     * Create a fresh directory "<tmp>/<prefix>XXXXXX<suffix>".
     * @return Owning handle or IOError
     */
    [[nodiscard]] static pkgaudit::Result<std::shared_ptr<TemporaryDirectory>>
    create(std::string_view prefix, std::string_view suffix = {});

    ~TemporaryDirectory();

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

private:
    struct Token
    {
    };

public:
    TemporaryDirectory(Token, std::filesystem::path path);

private:
    std::filesystem::path m_path;
};

struct LocationMetadata
{
    std::string mime;  ///< Content type, always set
    std::map<std::string, std::string, std::less<>> properties;
};

class ScanLocation;
using ScanLocationPtr = std::shared_ptr<ScanLocation>;

/**
 * @brief One artifact queued for analysis.
 *
 * Locations created for an extraction (cleanup() is true) own their
 * temporary directory; every location below it shares that ownership, so
 * the directory is removed exactly once, after the last of them is gone.
 * The parent link is non-owning.
 */
class ScanLocation : public std::enable_shared_from_this<ScanLocation>
{
public:
    /// Top-level location; the content type is detected from the path
    [[nodiscard]] static ScanLocationPtr create(std::filesystem::path path);
    [[nodiscard]] static ScanLocationPtr create(std::filesystem::path path, LocationMetadata metadata);

    /// Location for a path inside this one (same extraction depth and workspace)
    [[nodiscard]] ScanLocationPtr create_child(std::filesystem::path path) const;

    /// Location for a new extraction directory owned by the child
    [[nodiscard]] ScanLocationPtr create_child(std::shared_ptr<TemporaryDirectory> workspace) const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

    /**
     * Stable display name used in findings and signatures.
     *
     * Paths inside an extraction workspace are shown relative to it and
     * prefixed by the display name of the extracted archive, joined by '$'
     * (e.g. "pkg.zip$lib/inner.tar.gz$setup.py"), so two scans of the same
     * input produce the same names. Other locations show their path.
     */
    [[nodiscard]] const std::string& str() const noexcept { return m_display; }
    [[nodiscard]] const LocationMetadata& metadata() const noexcept { return m_metadata; }
    [[nodiscard]] LocationMetadata& metadata() noexcept { return m_metadata; }
    [[nodiscard]] const std::string& mime() const noexcept { return m_metadata.mime; }
    [[nodiscard]] bool is_directory() const;

    /// Parent location if it is still alive
    [[nodiscard]] std::shared_ptr<const ScanLocation> parent() const { return m_parent.lock(); }

    /// Number of extractions above this location
    [[nodiscard]] int depth() const noexcept { return m_depth; }

    /// True if this location owns the removal of its directory
    [[nodiscard]] bool cleanup() const noexcept { return m_cleanup; }
    [[nodiscard]] const std::shared_ptr<TemporaryDirectory>& workspace() const noexcept
    {
        return m_workspace;
    }

    /// "b side" of a differential pair
    [[nodiscard]] const ScanLocationPtr& peer() const noexcept { return m_peer; }
    void set_peer(ScanLocationPtr peer) { m_peer = std::move(peer); }

private:
    struct Token
    {
    };

public:
    ScanLocation(Token, std::filesystem::path path, LocationMetadata metadata);

private:
    std::filesystem::path m_path;
    std::string m_display;
    std::string m_archive_display;  ///< Display name of the archive extracted into m_workspace
    LocationMetadata m_metadata;
    std::weak_ptr<const ScanLocation> m_parent;
    int m_depth = 0;
    bool m_cleanup = false;
    std::shared_ptr<TemporaryDirectory> m_workspace;
    ScanLocationPtr m_peer;
};

}  // namespace pkgaudit::scan
