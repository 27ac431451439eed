#pragma once

/**
 * @file archive.hpp
 * @brief Archive safety checks and extraction for recursive scanning
 *
 * Every member of a gzip/bzip2 tar or zip archive is classified before any
 * byte is written. Only approved members are extracted, into a temporary
 * directory owned by the child location yielded for it.
 */

#include "pkgaudit/config.hpp"
#include "pkgaudit/diff.hpp"
#include "pkgaudit/scan/content_type.hpp"
#include "pkgaudit/scan/pipeline.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pkgaudit::analyzers {

/// Prefix of extraction directory names
inline constexpr std::string_view kSandboxPrefix = "pkgaudit_pkg__sandbox";

enum class MemberType {
    kFile,
    kDirectory,
    kSymlink,
    kHardlink,
    kOther  ///< Devices, FIFOs and other special files
};

struct ArchiveMember
{
    std::string path;
    std::uint64_t size = 0;
    MemberType type = MemberType::kFile;
};

enum class MemberVerdict {
    kApproved,
    kAbsolutePath,
    kParentReference,
    kOversized,
    kSkipped  ///< Tar links and special files: neither reported nor extracted
};

/**
 * Classify one member. Checks run in order: absolute path, parent
 * reference, then (tar) links and special files, then size.
 */
[[nodiscard]] MemberVerdict classify_member(const ArchiveMember& member,
                                            scan::ArchiveFormat format,
                                            std::optional<std::uint64_t> max_size);

class ArchiveAnalyzer final : public scan::Analyzer
{
public:
    explicit ArchiveAnalyzer(const Config& config);

    [[nodiscard]] std::string_view name() const override { return "archive"; }

    /**
     * For a supported archive: first the extraction location, then one
     * Finding per anomalous member in archive order, extracting approved
     * members as the stream advances. Other locations yield nothing.
     */
    [[nodiscard]] scan::OutputStreamPtr analyze(const scan::ScanLocationPtr& location) override;

private:
    const Config& m_config;
};

/**
 * Differential archive mode for a modified or renamed pair whose contents
 * differ: anomalies of both sides, then (if either side unpacked) the a-side
 * location with the b-side attached as its peer.
 */
[[nodiscard]] scan::OutputStreamPtr diff_archive(const DiffEntry& entry, const Config& config);

}  // namespace pkgaudit::analyzers
