/**
 * @file test_diff.cpp
 * @brief Tree differences and the differential archive mode
 */

#include "pkgaudit/diff.hpp"

#include "pkgaudit/analyzers/archive.hpp"
#include "pkgaudit/common.hpp"

#include "../support/test_archives.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

namespace pkgaudit::test {

namespace {

std::filesystem::path make_fixture_dir(const std::string& name)
{
    auto dir = std::filesystem::path(::testing::TempDir()) / ("pkgaudit_diff_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

/// "<op> <relative path>" using the a side where present
std::vector<std::string> describe(const std::vector<DiffEntry>& entries)
{
    std::vector<std::string> lines;
    for (const auto& entry : entries) {
        const auto& path = entry.a_path.empty() ? entry.b_path : entry.a_path;
        const auto& root = entry.a_path.empty() ? entry.b_scan->path() : entry.a_scan->path();
        lines.push_back(std::string(1, to_char(entry.operation)) + " "
                        + path.lexically_relative(root).generic_string());
    }
    return lines;
}

TEST(DiffTreesTest, ClassifiesAndOrdersEntries)
{
    const auto dir = make_fixture_dir("ordering");
    write_text_file(dir / "a" / "same.txt", "same");
    write_text_file(dir / "b" / "same.txt", "same");
    write_text_file(dir / "a" / "pkg" / "mod.py", "x = 1");
    write_text_file(dir / "b" / "pkg" / "mod.py", "x = 2");
    write_text_file(dir / "a" / "old_name.py", "moved");
    write_text_file(dir / "b" / "new_name.py", "moved");
    write_text_file(dir / "a" / "gone.txt", "gone");
    write_text_file(dir / "b" / "added.txt", "added");

    auto entries =
        diff_trees(scan::ScanLocation::create(dir / "a"), scan::ScanLocation::create(dir / "b"));
    ASSERT_TRUE(entries.has_value()) << entries.error().message;
    EXPECT_EQ(describe(*entries),
              (std::vector<std::string>{
                  "A added.txt", "D gone.txt", "M pkg/mod.py", "R old_name.py"}));

    const auto& renamed = entries->back();
    EXPECT_EQ(renamed.b_path.string(), (dir / "b" / "new_name.py").string());
    EXPECT_EQ(renamed.a_sha256, renamed.b_sha256);

    const auto& modified = (*entries)[2];
    EXPECT_NE(modified.a_sha256, modified.b_sha256);
    EXPECT_EQ(modified.b_path.string(), (dir / "b" / "pkg" / "mod.py").string());
}

TEST(DiffTreesTest, AmbiguousContentIsNotARename)
{
    const auto dir = make_fixture_dir("ambiguous");
    write_text_file(dir / "a" / "one.txt", "dup");
    write_text_file(dir / "a" / "two.txt", "dup");
    write_text_file(dir / "b" / "copy.txt", "dup");

    auto entries =
        diff_trees(scan::ScanLocation::create(dir / "a"), scan::ScanLocation::create(dir / "b"));
    ASSERT_TRUE(entries.has_value());
    EXPECT_EQ(describe(*entries),
              (std::vector<std::string>{"A copy.txt", "D one.txt", "D two.txt"}));
}

TEST(DiffTreesTest, SingleFiles)
{
    const auto dir = make_fixture_dir("files");
    write_text_file(dir / "a.tar.gz", "first");
    write_text_file(dir / "b.tar.gz", "second");
    write_text_file(dir / "c.tar.gz", "first");

    auto changed = diff_trees(scan::ScanLocation::create(dir / "a.tar.gz"),
                              scan::ScanLocation::create(dir / "b.tar.gz"));
    ASSERT_TRUE(changed.has_value());
    ASSERT_EQ(changed->size(), 1U);
    EXPECT_EQ(changed->front().operation, DiffOperation::kModified);

    auto unchanged = diff_trees(scan::ScanLocation::create(dir / "a.tar.gz"),
                                scan::ScanLocation::create(dir / "c.tar.gz"));
    ASSERT_TRUE(unchanged.has_value());
    EXPECT_TRUE(unchanged->empty());
}

TEST(DiffTreesTest, UnreadableRootIsAnError)
{
    const auto dir = make_fixture_dir("missing");
    write_text_file(dir / "b" / "file.txt", "content");

    auto entries =
        diff_trees(scan::ScanLocation::create(dir / "a.zip"), scan::ScanLocation::create(dir / "b"));
    ASSERT_FALSE(entries.has_value());
    EXPECT_EQ(entries.error().code, "IOError");
}

TEST(DiffEntryTest, ToJson)
{
    DiffEntry added{.operation = DiffOperation::kAdded, .b_path = "b/new.txt", .b_sha256 = "ab12"};
    const auto j = added.to_json();
    EXPECT_EQ(j.at("operation"), "A");
    EXPECT_TRUE(j.at("a_path").is_null());
    EXPECT_TRUE(j.at("a_sha256").is_null());
    EXPECT_EQ(j.at("b_path"), "b/new.txt");
    EXPECT_EQ(j.at("b_sha256"), "ab12");
}

TEST(DiffArchiveTest, IdenticalContentIsNotAnalyzed)
{
    const auto dir = make_fixture_dir("identical");
    write_archive(dir / "a.zip", FixtureFormat::kZip, {{.path = "../evil", .content = "x"}});
    std::filesystem::copy_file(dir / "a.zip", dir / "b.zip");
    const auto hash = common::sha256_file(dir / "a.zip");
    ASSERT_TRUE(hash.has_value());

    Config config;
    const auto root = scan::ScanLocation::create(dir);
    for (const auto operation : {DiffOperation::kModified, DiffOperation::kRenamed}) {
        DiffEntry entry{.operation = operation,
                        .a_path = dir / "a.zip",
                        .b_path = dir / "b.zip",
                        .a_sha256 = *hash,
                        .b_sha256 = *hash,
                        .a_scan = root,
                        .b_scan = root};
        auto stream = analyzers::diff_archive(entry, config);
        EXPECT_FALSE(stream->next().has_value());
    }
}

TEST(DiffArchiveTest, AddedAndDeletedAreNotAnalyzed)
{
    const auto dir = make_fixture_dir("added");
    write_archive(dir / "b.zip", FixtureFormat::kZip, {{.path = "../evil", .content = "x"}});

    Config config;
    const auto root = scan::ScanLocation::create(dir);
    DiffEntry entry{.operation = DiffOperation::kAdded,
                    .b_path = dir / "b.zip",
                    .b_sha256 = "ff",
                    .a_scan = root,
                    .b_scan = root};
    EXPECT_FALSE(analyzers::diff_archive(entry, config)->next().has_value());
}

TEST(DiffArchiveTest, ModifiedArchivesArePairedForNestedDiff)
{
    const auto dir = make_fixture_dir("modified");
    write_archive(dir / "a" / "pkg.zip",
                  FixtureFormat::kZip,
                  {{.path = "../evil.sh", .content = "rm -rf"},
                   {.path = "setup.py", .content = "v1"}});
    write_archive(dir / "b" / "pkg.zip",
                  FixtureFormat::kZip,
                  {{.path = "setup.py", .content = "v2"},
                   {.path = "/etc/cron.d/job", .content = "* *"}});

    Config config;
    auto entries =
        diff_trees(scan::ScanLocation::create(dir / "a"), scan::ScanLocation::create(dir / "b"));
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 1U);

    std::vector<Finding> findings;
    std::vector<scan::ScanLocationPtr> locations;
    auto stream = analyzers::diff_archive(entries->front(), config);
    while (auto item = stream->next()) {
        if (auto* location = std::get_if<scan::ScanLocationPtr>(&*item)) {
            locations.push_back(std::move(*location));
        } else {
            findings.push_back(std::get<Finding>(std::move(*item)));
        }
    }

    // a side first, then b side
    ASSERT_EQ(findings.size(), 2U);
    EXPECT_EQ(findings[0].extra().at("entry_type"), "parent_reference");
    EXPECT_EQ(findings[1].extra().at("entry_type"), "absolute_path");

    ASSERT_EQ(locations.size(), 1U);
    const auto& extracted = locations.front();
    ASSERT_NE(extracted->peer(), nullptr);
    EXPECT_EQ(extracted->depth(), 1);
    EXPECT_TRUE(std::filesystem::exists(extracted->path() / "setup.py"));
    EXPECT_TRUE(std::filesystem::exists(extracted->peer()->path() / "setup.py"));

    auto nested = diff_trees(extracted, extracted->peer());
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(describe(*nested), (std::vector<std::string>{"M setup.py"}));
}

}  // namespace

}  // namespace pkgaudit::test
