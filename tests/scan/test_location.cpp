/**
 * @file test_location.cpp
 * @brief Scan location hierarchy and workspace cleanup
 */

#include "pkgaudit/scan/location.hpp"

#include "pkgaudit/scan/content_type.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace pkgaudit::scan::test {

namespace {

TEST(TemporaryDirectoryTest, CreatesAndRemoves)
{
    std::filesystem::path path;
    {
        auto workspace = TemporaryDirectory::create("pkgaudit_test_", "_pkg.zip");
        ASSERT_TRUE(workspace.has_value()) << workspace.error().message;
        path = (*workspace)->path();
        EXPECT_TRUE(std::filesystem::is_directory(path));
        EXPECT_TRUE(path.filename().string().starts_with("pkgaudit_test_"));
        EXPECT_TRUE(path.filename().string().ends_with("_pkg.zip"));

        std::ofstream(path / "file.txt") << "content";
        std::filesystem::create_directories(path / "nested" / "dir");
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(ScanLocationTest, TopLevelLocation)
{
    auto location = ScanLocation::create(::testing::TempDir());
    EXPECT_TRUE(location->is_directory());
    EXPECT_EQ(location->mime(), kMimeDirectory);
    EXPECT_EQ(location->depth(), 0);
    EXPECT_FALSE(location->cleanup());
    EXPECT_EQ(location->parent(), nullptr);
    EXPECT_EQ(location->workspace(), nullptr);
}

TEST(ScanLocationTest, ExplicitMetadataIsKept)
{
    auto location = ScanLocation::create("pkg.bin", LocationMetadata{.mime = std::string(kMimeZip)});
    EXPECT_EQ(location->mime(), kMimeZip);
    location->metadata().properties["origin"] = "registry";
    EXPECT_EQ(location->metadata().properties.at("origin"), "registry");
}

TEST(ScanLocationTest, ExtractionChildOwnsWorkspace)
{
    auto root = ScanLocation::create("pkg.zip", LocationMetadata{.mime = std::string(kMimeZip)});
    auto workspace = TemporaryDirectory::create("pkgaudit_test_");
    ASSERT_TRUE(workspace.has_value());
    const auto path = (*workspace)->path();

    auto extracted = root->create_child(std::move(*workspace));
    EXPECT_EQ(extracted->depth(), 1);
    EXPECT_TRUE(extracted->cleanup());
    EXPECT_TRUE(extracted->is_directory());
    EXPECT_EQ(extracted->parent(), root);

    auto file = extracted->create_child(path / "inner.py");
    EXPECT_EQ(file->depth(), 1);
    EXPECT_FALSE(file->cleanup());
    EXPECT_EQ(file->workspace(), extracted->workspace());

    // The directory lives as long as any location below the extraction
    extracted.reset();
    EXPECT_TRUE(std::filesystem::exists(path));
    file.reset();
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(ScanLocationTest, DisplayNameIsIndependentOfWorkspace)
{
    auto display_chain = []() -> std::vector<std::string> {
        auto root = ScanLocation::create("dist/pkg.zip", LocationMetadata{.mime = std::string(kMimeZip)});
        auto outer = TemporaryDirectory::create("pkgaudit_test_");
        if (!outer) {
            ADD_FAILURE() << outer.error().message;
            return {};
        }
        const auto outer_path = (*outer)->path();
        auto extracted = root->create_child(std::move(*outer));
        auto archive = extracted->create_child(outer_path / "lib" / "inner.tar.gz");

        auto inner = TemporaryDirectory::create("pkgaudit_test_");
        if (!inner) {
            ADD_FAILURE() << inner.error().message;
            return {};
        }
        const auto inner_path = (*inner)->path();
        auto nested = archive->create_child(std::move(*inner));
        auto file = nested->create_child(inner_path / "setup.py");
        return {root->str(), extracted->str(), archive->str(), nested->str(), file->str()};
    };

    const auto first = display_chain();
    EXPECT_EQ(first,
              (std::vector<std::string>{"dist/pkg.zip",
                                        "dist/pkg.zip$",
                                        "dist/pkg.zip$lib/inner.tar.gz",
                                        "dist/pkg.zip$lib/inner.tar.gz$",
                                        "dist/pkg.zip$lib/inner.tar.gz$setup.py"}));
    EXPECT_EQ(display_chain(), first);
}

TEST(ScanLocationTest, ParentLinkIsWeak)
{
    auto root = ScanLocation::create("pkg.zip", LocationMetadata{.mime = std::string(kMimeZip)});
    auto child = root->create_child("pkg.zip/inner");
    root.reset();
    EXPECT_EQ(child->parent(), nullptr);
}

TEST(ScanLocationTest, Peer)
{
    auto a = ScanLocation::create("a.zip", LocationMetadata{.mime = std::string(kMimeZip)});
    auto b = ScanLocation::create("b.zip", LocationMetadata{.mime = std::string(kMimeZip)});
    EXPECT_EQ(a->peer(), nullptr);
    a->set_peer(b);
    EXPECT_EQ(a->peer(), b);
}

}  // namespace

}  // namespace pkgaudit::scan::test
