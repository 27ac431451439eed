/**
 * @file diff.cpp
 * @brief Directory comparison by relative path and content hash
 */

#include "pkgaudit/diff.hpp"

#include "pkgaudit/scan/pipeline.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace pkgaudit {

namespace {

/// Relative path -> (absolute path, sha256)
using FileIndex = std::map<std::string, std::pair<std::filesystem::path, std::string>>;

[[nodiscard]] pkgaudit::Result<FileIndex> index_files(const scan::ScanLocationPtr& root)
{
    FileIndex index;
    std::vector<std::filesystem::path> files;
    if (root->is_directory()) {
        files = scan::list_regular_files(root->path());
    } else {
        files.push_back(root->path());
    }

    for (const auto& file : files) {
        auto hash = common::sha256_file(file);
        if (!hash) {
            return std::unexpected(hash.error());
        }
        auto relative = root->is_directory() ? file.lexically_relative(root->path()).generic_string()
                                             : std::string();
        index.emplace(std::move(relative), std::make_pair(file, std::move(*hash)));
    }
    return index;
}

[[nodiscard]] int operation_rank(DiffOperation operation) noexcept
{
    switch (operation) {
        case DiffOperation::kAdded:
            return 0;
        case DiffOperation::kDeleted:
            return 1;
        case DiffOperation::kModified:
            return 2;
        case DiffOperation::kRenamed:
            return 3;
    }
    return 4;
}

}  // namespace

char to_char(DiffOperation operation) noexcept
{
    return static_cast<char>(operation);
}

nlohmann::json DiffEntry::to_json() const
{
    nlohmann::json j = {
        {"operation", std::string(1, to_char(operation))}
    };
    j["a_path"] = a_path.empty() ? nlohmann::json(nullptr) : nlohmann::json(a_path.string());
    j["b_path"] = b_path.empty() ? nlohmann::json(nullptr) : nlohmann::json(b_path.string());
    j["a_sha256"] = a_sha256.empty() ? nlohmann::json(nullptr) : nlohmann::json(a_sha256);
    j["b_sha256"] = b_sha256.empty() ? nlohmann::json(nullptr) : nlohmann::json(b_sha256);
    return j;
}

pkgaudit::Result<std::vector<DiffEntry>> diff_trees(const scan::ScanLocationPtr& a,
                                                    const scan::ScanLocationPtr& b)
{
    auto a_index = index_files(a);
    if (!a_index) {
        return std::unexpected(a_index.error());
    }
    auto b_index = index_files(b);
    if (!b_index) {
        return std::unexpected(b_index.error());
    }

    std::vector<DiffEntry> entries;
    std::vector<const FileIndex::value_type*> only_a;
    std::vector<const FileIndex::value_type*> only_b;

    for (const auto& item : *a_index) {
        auto match = b_index->find(item.first);
        if (match == b_index->end()) {
            only_a.push_back(&item);
            continue;
        }
        if (item.second.second != match->second.second) {
            entries.push_back(DiffEntry{.operation = DiffOperation::kModified,
                                        .a_path = item.second.first,
                                        .b_path = match->second.first,
                                        .a_sha256 = item.second.second,
                                        .b_sha256 = match->second.second,
                                        .a_scan = a,
                                        .b_scan = b});
        }
    }
    for (const auto& item : *b_index) {
        if (!a_index->contains(item.first)) {
            only_b.push_back(&item);
        }
    }

    // Pair unmatched files whose content is unique on both sides
    const auto count_hash = [](const auto& side, const std::string& hash) {
        return std::ranges::count_if(side,
                                     [&hash](const auto* item) { return item->second.second == hash; });
    };
    std::vector<bool> b_paired(only_b.size(), false);
    for (const auto* a_item : only_a) {
        const auto& hash = a_item->second.second;
        auto b_item = std::ranges::find_if(
            only_b, [&hash](const auto* item) { return item->second.second == hash; });
        if (b_item != only_b.end() && count_hash(only_a, hash) == 1 && count_hash(only_b, hash) == 1) {
            b_paired[static_cast<std::size_t>(b_item - only_b.begin())] = true;
            entries.push_back(DiffEntry{.operation = DiffOperation::kRenamed,
                                        .a_path = a_item->second.first,
                                        .b_path = (*b_item)->second.first,
                                        .a_sha256 = hash,
                                        .b_sha256 = hash,
                                        .a_scan = a,
                                        .b_scan = b});
            continue;
        }
        entries.push_back(DiffEntry{.operation = DiffOperation::kDeleted,
                                    .a_path = a_item->second.first,
                                    .a_sha256 = hash,
                                    .a_scan = a,
                                    .b_scan = b});
    }
    for (std::size_t i = 0; i < only_b.size(); ++i) {
        if (b_paired[i]) {
            continue;
        }
        entries.push_back(DiffEntry{.operation = DiffOperation::kAdded,
                                    .b_path = only_b[i]->second.first,
                                    .b_sha256 = only_b[i]->second.second,
                                    .a_scan = a,
                                    .b_scan = b});
    }

    std::ranges::stable_sort(entries, [](const DiffEntry& lhs, const DiffEntry& rhs) {
        const auto lhs_rank = operation_rank(lhs.operation);
        const auto rhs_rank = operation_rank(rhs.operation);
        if (lhs_rank != rhs_rank) {
            return lhs_rank < rhs_rank;
        }
        const auto& lhs_path = lhs.a_path.empty() ? lhs.b_path : lhs.a_path;
        const auto& rhs_path = rhs.a_path.empty() ? rhs.b_path : rhs.a_path;
        return lhs_path < rhs_path;
    });
    return entries;
}

}  // namespace pkgaudit
