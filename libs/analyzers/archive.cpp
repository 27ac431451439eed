/**
 * @file archive.cpp
 * @brief libarchive-backed member classification and extraction
 */

#include "pkgaudit/analyzers/archive.hpp"

#include "pkgaudit/common.hpp"
#include "pkgaudit/finding.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

namespace pkgaudit::analyzers {

namespace {

constexpr std::size_t kReadBlockSize = 10240;

struct ArchiveReadDeleter
{
    void operator()(struct archive* handle) const noexcept { archive_read_free(handle); }
};

using ArchiveReadPtr = std::unique_ptr<struct archive, ArchiveReadDeleter>;

[[nodiscard]] std::string archive_message(struct archive* handle)
{
    const char* message = handle != nullptr ? archive_error_string(handle) : nullptr;
    return message != nullptr ? std::string(message) : std::string("unknown archive error");
}

[[nodiscard]] ArchiveMember describe_member(struct archive_entry* entry)
{
    ArchiveMember member;
    const char* pathname = archive_entry_pathname(entry);
    member.path = pathname != nullptr ? pathname : "";
    if (archive_entry_size_is_set(entry) != 0 && archive_entry_size(entry) > 0) {
        member.size = static_cast<std::uint64_t>(archive_entry_size(entry));
    }

    if (archive_entry_hardlink(entry) != nullptr) {
        member.type = MemberType::kHardlink;
        return member;
    }
    switch (archive_entry_filetype(entry)) {
        case AE_IFREG:
            member.type = MemberType::kFile;
            break;
        case AE_IFDIR:
            member.type = MemberType::kDirectory;
            break;
        case AE_IFLNK:
            member.type = MemberType::kSymlink;
            break;
        default:
            member.type = MemberType::kOther;
            break;
    }
    return member;
}

[[nodiscard]] Finding suspicious_member(const Config& config,
                                        const scan::ScanLocation& location,
                                        MemberVerdict verdict,
                                        const std::string& member_path)
{
    const bool absolute = verdict == MemberVerdict::kAbsolutePath;
    const std::string entry_type = absolute ? "absolute_path" : "parent_reference";
    const std::string normalized = common::normalize_path(member_path);

    nlohmann::ordered_json extra = nlohmann::ordered_json::object();
    extra["entry_type"] = entry_type;
    extra["entry_path"] = normalized;

    return Finding(Finding::Fields{
        .type = "SuspiciousArchiveEntry",
        .location = location.str(),
        .message = absolute ? "Archive contains an entry with an absolute path"
                            : "Archive contains an entry referencing a parent directory",
        .signature = make_signature({"suspicious_archive_entry", entry_type, normalized, location.str()}),
        .score = absolute
                     ? config.score_or_default("suspicious-archive-entry-absolute-path", 50)
                     : config.score_or_default("suspicious-archive-entry-parent-reference", 50),
        .extra = std::move(extra),
    });
}

[[nodiscard]] Finding oversized_member(const Config& config,
                                       const scan::ScanLocation& location,
                                       scan::ArchiveFormat format,
                                       const ArchiveMember& member,
                                       std::uint64_t limit)
{
    nlohmann::ordered_json extra = nlohmann::ordered_json::object();
    extra["archive_path"] = member.path;
    extra["reason"] = "file_size_exceeded";
    extra["size"] = member.size;
    extra["limit"] = limit;

    // Tar members are reported more severely than zip members
    const int score = format == scan::ArchiveFormat::kZip
                          ? config.score_or_default("archive-entry-size-exceeded", 10)
                          : config.score_or_default("archive-file-size-exceeded", 100);

    return Finding(Finding::Fields{
        .type = "ArchiveAnomaly",
        .location = location.str(),
        .message = "Archive contains a file that exceeds the configured maximum size",
        .signature = make_signature({"archive_anomaly", "size", location.str(), member.path}),
        .score = score,
        .extra = std::move(extra),
    });
}

[[nodiscard]] Finding read_error(const Config& config,
                                 const scan::ScanLocation& location,
                                 const Error& error)
{
    nlohmann::ordered_json extra = nlohmann::ordered_json::object();
    extra["reason"] = "archive_read_error";
    extra["exc_message"] = error.message;
    extra["exc_type"] = error.code;
    extra["mime"] = location.mime();

    return Finding(Finding::Fields{
        .type = "ArchiveAnomaly",
        .location = location.str(),
        .message = "Could not open the archive for analysis",
        .signature = make_signature({"archive_anomaly", "read_error", location.str()}),
        .score = config.score_or_default("corrupted-archive", 10),
        .extra = std::move(extra),
    });
}

/**
 * Lazy walk over one archive: the extraction location first, then anomalies
 * in member order. Approved members are written while searching for the
 * next anomaly.
 */
class ArchiveStream final : public scan::OutputStream
{
public:
    ArchiveStream(const Config& config, scan::ScanLocationPtr location, scan::ArchiveFormat format)
        : m_config(config)
        , m_location(std::move(location))
        , m_format(format)
    {}

    [[nodiscard]] std::optional<scan::ScanOutput> next() override
    {
        switch (m_stage) {
            case Stage::kWorkspace:
                return create_workspace();
            case Stage::kOpen:
                if (auto failure = open_archive()) {
                    return failure;
                }
                m_stage = Stage::kMembers;
                return next_anomaly();
            case Stage::kMembers:
                return next_anomaly();
            case Stage::kDone:
                return std::nullopt;
        }
        return std::nullopt;
    }

private:
    enum class Stage {
        kWorkspace,
        kOpen,
        kMembers,
        kDone
    };

    [[nodiscard]] std::optional<scan::ScanOutput> create_workspace()
    {
        auto workspace =
            scan::TemporaryDirectory::create(kSandboxPrefix, m_location->path().filename().string());
        if (!workspace) {
            spdlog::error("Cannot extract '{}': {}", m_location->str(), workspace.error().message);
            m_stage = Stage::kDone;
            return std::nullopt;
        }
        m_workspace = *workspace;
        spdlog::info("Extracting to: '{}' [{}]", m_workspace->path().string(), m_location->mime());
        m_stage = Stage::kOpen;
        return m_location->create_child(m_workspace);
    }

    /// Open the container; a Finding on failure
    [[nodiscard]] std::optional<scan::ScanOutput> open_archive()
    {
        m_handle.reset(archive_read_new());
        if (!m_handle) {
            return fail(Error::make("ArchiveOpenFailed", "archive_read_new failed"));
        }
        if (m_format == scan::ArchiveFormat::kZip) {
            // Central directory order
            archive_read_support_format_zip_seekable(m_handle.get());
        } else {
            archive_read_support_filter_gzip(m_handle.get());
            archive_read_support_filter_bzip2(m_handle.get());
            archive_read_support_format_tar(m_handle.get());
        }
        if (archive_read_open_filename(m_handle.get(), m_location->path().c_str(), kReadBlockSize)
            != ARCHIVE_OK) {
            return fail(Error::make("ArchiveOpenFailed", archive_message(m_handle.get())));
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<scan::ScanOutput> next_anomaly()
    {
        const auto max_size = m_config.maximum_archive_size();
        while (m_stage == Stage::kMembers) {
            struct archive_entry* entry = nullptr;
            const int status = archive_read_next_header(m_handle.get(), &entry);
            if (status == ARCHIVE_EOF) {
                finish();
                break;
            }
            if (status == ARCHIVE_RETRY) {
                continue;
            }
            if (status < ARCHIVE_WARN) {
                return fail(Error::make("ArchiveHeaderError", archive_message(m_handle.get())));
            }
            if (status == ARCHIVE_WARN) {
                spdlog::debug("'{}': {}", m_location->str(), archive_message(m_handle.get()));
            }

            const ArchiveMember member = describe_member(entry);
            const MemberVerdict verdict = classify_member(member, m_format, max_size);
            switch (verdict) {
                case MemberVerdict::kAbsolutePath:
                case MemberVerdict::kParentReference:
                    return suspicious_member(m_config, *m_location, verdict, member.path);
                case MemberVerdict::kOversized:
                    return oversized_member(m_config, *m_location, m_format, member, *max_size);
                case MemberVerdict::kSkipped:
                    spdlog::debug("Skipping link or special member '{}' of '{}'",
                                  member.path,
                                  m_location->str());
                    break;
                case MemberVerdict::kApproved:
                    if (auto failure = extract(member)) {
                        return failure;
                    }
                    break;
            }
        }
        return std::nullopt;
    }

    /// Write an approved member below the workspace; a Finding if the data is unreadable
    [[nodiscard]] std::optional<scan::ScanOutput> extract(const ArchiveMember& member)
    {
        const std::string relative = common::normalize_path(member.path);
        if (relative == ".") {
            return std::nullopt;
        }
        const auto target = m_workspace->path() / relative;

        std::error_code ec;
        if (member.type == MemberType::kDirectory) {
            std::filesystem::create_directories(target, ec);
            if (ec) {
                spdlog::warn("Failed to create '{}': {}", target.string(), ec.message());
            }
            return std::nullopt;
        }
        std::filesystem::create_directories(target.parent_path(), ec);
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::warn("Failed to create '{}'", target.string());
            return std::nullopt;
        }

        // Sizes declared in headers may lie; never write past the limit
        const auto limit = m_config.maximum_archive_size();
        const void* block = nullptr;
        std::size_t length = 0;
        la_int64_t offset = 0;
        while (true) {
            const int status = archive_read_data_block(m_handle.get(), &block, &length, &offset);
            if (status == ARCHIVE_EOF) {
                break;
            }
            if (status < ARCHIVE_WARN) {
                return fail(Error::make("ArchiveReadError", archive_message(m_handle.get())));
            }
            const auto start = static_cast<std::uint64_t>(offset);
            if (limit.has_value() && start + length > *limit) {
                spdlog::warn("Truncated '{}' of '{}' at {} bytes", member.path, m_location->str(), *limit);
                length = start < *limit ? static_cast<std::size_t>(*limit - start) : 0;
                out.seekp(static_cast<std::streamoff>(start));
                out.write(static_cast<const char*>(block), static_cast<std::streamsize>(length));
                break;
            }
            out.seekp(static_cast<std::streamoff>(start));
            out.write(static_cast<const char*>(block), static_cast<std::streamsize>(length));
        }
        if (!out) {
            spdlog::warn("Failed to write '{}'", target.string());
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<scan::ScanOutput> fail(const Error& error)
    {
        auto finding = read_error(m_config, *m_location, error);
        finish();
        return finding;
    }

    void finish()
    {
        m_handle.reset();
        m_stage = Stage::kDone;
    }

    const Config& m_config;
    scan::ScanLocationPtr m_location;
    scan::ArchiveFormat m_format;
    std::shared_ptr<scan::TemporaryDirectory> m_workspace;
    ArchiveReadPtr m_handle;
    Stage m_stage = Stage::kWorkspace;
};

}  // namespace

MemberVerdict classify_member(const ArchiveMember& member,
                              scan::ArchiveFormat format,
                              std::optional<std::uint64_t> max_size)
{
    if (common::is_absolute_path(member.path)) {
        return MemberVerdict::kAbsolutePath;
    }
    if (common::has_parent_reference(member.path)) {
        return MemberVerdict::kParentReference;
    }
    if (format != scan::ArchiveFormat::kZip) {
        if (member.type == MemberType::kDirectory) {
            return MemberVerdict::kApproved;
        }
        if (member.type != MemberType::kFile) {
            return MemberVerdict::kSkipped;
        }
    }
    if (max_size.has_value() && member.size > *max_size) {
        return MemberVerdict::kOversized;
    }
    return MemberVerdict::kApproved;
}

ArchiveAnalyzer::ArchiveAnalyzer(const Config& config)
    : m_config(config)
{}

scan::OutputStreamPtr ArchiveAnalyzer::analyze(const scan::ScanLocationPtr& location)
{
    const auto format = scan::archive_format(location->mime());
    if (location->is_directory() || format == scan::ArchiveFormat::kUnsupported) {
        return std::make_unique<scan::VectorStream>();
    }
    return std::make_unique<ArchiveStream>(m_config, location, format);
}

scan::OutputStreamPtr diff_archive(const DiffEntry& entry, const Config& config)
{
    if (entry.operation != DiffOperation::kModified && entry.operation != DiffOperation::kRenamed) {
        return std::make_unique<scan::VectorStream>();
    }
    if (entry.a_sha256 == entry.b_sha256) {
        return std::make_unique<scan::VectorStream>();
    }

    ArchiveAnalyzer analyzer(config);
    const auto run_side = [&analyzer](const scan::ScanLocationPtr& location,
                                      std::vector<scan::ScanOutput>& findings,
                                      std::vector<scan::ScanLocationPtr>& locations) {
        auto stream = analyzer.analyze(location);
        while (auto item = stream->next()) {
            if (auto* child = std::get_if<scan::ScanLocationPtr>(&*item)) {
                locations.push_back(std::move(*child));
            } else {
                findings.push_back(std::move(*item));
            }
        }
    };

    auto a_location = entry.a_scan->create_child(entry.a_path);
    auto b_location = entry.b_scan->create_child(entry.b_path);

    std::vector<scan::ScanOutput> outputs;
    std::vector<scan::ScanOutput> b_findings;
    std::vector<scan::ScanLocationPtr> a_locations;
    std::vector<scan::ScanLocationPtr> b_locations;
    run_side(a_location, outputs, a_locations);
    run_side(b_location, b_findings, b_locations);
    std::ranges::move(b_findings, std::back_inserter(outputs));

    if (!a_locations.empty() || !b_locations.empty()) {
        auto paired_a = a_locations.empty() ? a_location : a_locations.front();
        auto paired_b = b_locations.empty() ? b_location : b_locations.front();
        paired_a->set_peer(std::move(paired_b));
        outputs.emplace_back(std::move(paired_a));
    }
    return std::make_unique<scan::VectorStream>(std::move(outputs));
}

}  // namespace pkgaudit::analyzers
