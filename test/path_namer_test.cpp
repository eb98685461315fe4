//
// Created by the packrat authors on 18/10/26.
//

#include <gtest/gtest.h>
#include "test_support.hpp"
#include "../libpackrat/include/path_namer.hpp"

namespace fs = std::filesystem;
using packrat::Options;
using packrat::PathNamer;
using packrat::test::TempDir;
using packrat::test::write_file;

TEST(PathNamerTest, SeveralInputsAlwaysKeepBaseFolderName) {
    const auto opts = Options{}.includeBaseFolderName(false);
    EXPECT_TRUE(PathNamer::should_include_base_folder_name(opts, {"/data/a", "/data/b"}));
}

TEST(PathNamerTest, SingleInputFollowsOption) {
    EXPECT_TRUE(PathNamer::should_include_base_folder_name(Options{}, {"/data/a"}));
    EXPECT_FALSE(PathNamer::should_include_base_folder_name(
        Options{}.includeBaseFolderName(false), {"/data/a"}));
}

TEST(PathNamerTest, FilesystemRootForcesBaseFolderName) {
    EXPECT_TRUE(PathNamer::should_include_base_folder_name(
        Options{}.includeBaseFolderName(false), {"/"}));
}

TEST(PathNamerTest, BareRelativeNameForcesBaseFolderName) {
    const auto opts = Options{}.includeBaseFolderName(false);
    EXPECT_TRUE(PathNamer::should_include_base_folder_name(opts, {"dir"}));
    EXPECT_TRUE(PathNamer::should_include_base_folder_name(opts, {"dir/"}));
    EXPECT_FALSE(PathNamer::should_include_base_folder_name(opts, {"./dir"}));
    EXPECT_FALSE(PathNamer::should_include_base_folder_name(opts, {"data/dir"}));
}

TEST(PathNamerTest, ParentIgnoresTrailingSeparator) {
    EXPECT_EQ(PathNamer::parent_of("/data/a/"), fs::path("/data"));
    EXPECT_EQ(PathNamer::parent_of("/data/a"), fs::path("/data"));
    EXPECT_EQ(PathNamer::parent_of("a"), fs::path("."));
    EXPECT_TRUE(PathNamer::parent_of("/").empty());
}

TEST(PathNamerTest, RelativizationRootOfFolder) {
    TempDir tmp;
    const auto dir = tmp / "photos";
    fs::create_directories(dir);

    EXPECT_EQ(PathNamer::relativization_root(dir, true), tmp.path());
    EXPECT_EQ(PathNamer::relativization_root(dir, false), dir);
}

TEST(PathNamerTest, RelativizationRootOfFileIsAlwaysItsParent) {
    TempDir tmp;
    const auto file = tmp / "notes.txt";
    write_file(file, "x");

    EXPECT_EQ(PathNamer::relativization_root(file, true), tmp.path());
    EXPECT_EQ(PathNamer::relativization_root(file, false), tmp.path());
}

TEST(PathNamerTest, EntryNames) {
    const fs::path root = "/data";
    EXPECT_EQ(PathNamer::entry_name(root, "/data/a", true), "a/");
    EXPECT_EQ(PathNamer::entry_name(root, "/data/a/x.txt", false), "a/x.txt");
    EXPECT_EQ(PathNamer::entry_name(root, "/data/a/b/c", true), "a/b/c/");
}

TEST(PathNamerTest, RootItselfYieldsNoEntry) {
    EXPECT_FALSE(PathNamer::entry_name("/data/a", "/data/a", true).has_value());
    EXPECT_FALSE(PathNamer::entry_name("/data/a", "/data/a/", true).has_value());
}

TEST(PathNamerTest, RelativeInputs) {
    EXPECT_EQ(PathNamer::entry_name(".", "a", true), "a/");
    EXPECT_EQ(PathNamer::entry_name(".", "a/x.txt", false), "a/x.txt");
}
