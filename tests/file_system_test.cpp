#include "file_system.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>

using namespace quickpack;

TEST(FileSystemTest, NormalizePath) {
    EXPECT_EQ(normalize_path("/a/./b/../c").generic_string(), "/a/c");
    EXPECT_EQ(normalize_path("/a/b/..").generic_string(), "/a");
    EXPECT_EQ(normalize_path("/").generic_string(), "/");
}

TEST(FileSystemTest, ContentDigestIsStable) {
    EXPECT_EQ(content_digest("abc"), content_digest("abc"));
    EXPECT_NE(content_digest("abc"), content_digest("abd"));
    EXPECT_EQ(content_digest("").size(), 32u);
    // First 16 bytes of SHA-256("")
    EXPECT_EQ(content_digest(""), "e3b0c44298fc1c149afbf4c8996fb924");
}

TEST(FileSystemTest, MemoryFileSystemKinds) {
    MemoryFileSystem fs;
    fs.write("/project/src/index.js", "x");

    EXPECT_EQ(fs.kind("/project/src/index.js"), FileKind::File);
    EXPECT_EQ(fs.kind("/project/src"), FileKind::Directory);
    EXPECT_EQ(fs.kind("/project"), FileKind::Directory);
    EXPECT_EQ(fs.kind("/project/sr"), FileKind::Missing);
    EXPECT_EQ(fs.kind("/project/src/index.js/x"), FileKind::Missing);

    auto content = fs.read("/project/src/../src/index.js");
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(content->bytes, "x");
    EXPECT_FALSE(fs.read("/project/other.js").has_value());

    EXPECT_TRUE(fs.remove("/project/src/index.js"));
    EXPECT_EQ(fs.kind("/project"), FileKind::Missing);
}

TEST(FileSystemTest, ReadsAreMemoized) {
    TaskGraph graph;
    MemoryFileSystem fs;
    fs.write("/a.js", "1");

    auto first = read_file(graph, fs, "/a.js");
    auto second = read_file(graph, fs, "/./a.js");
    EXPECT_EQ(first, second);
    EXPECT_EQ(fs.read_count(), 1u);
    EXPECT_EQ((*first)->bytes, "1");
}

TEST(FileSystemTest, InvalidatesOnlyChangedFiles) {
    TaskGraph graph;
    MemoryFileSystem fs;
    fs.write("/a.js", "a");
    fs.write("/b.js", "b");

    (void)read_file(graph, fs, "/a.js");
    (void)read_file(graph, fs, "/b.js");
    (void)read_file(graph, fs, "/missing.js");
    EXPECT_EQ(file_kind(graph, fs, "/c.js"), FileKind::Missing);

    EXPECT_TRUE(invalidate_changed_files(graph, fs).empty());

    // Rewriting identical bytes bumps the revision but not the digest
    fs.write("/b.js", "b");
    fs.write("/a.js", "changed");
    fs.write("/c.js", "new");

    auto changed = invalidate_changed_files(graph, fs);
    std::sort(changed.begin(), changed.end());
    ASSERT_EQ(changed.size(), 2u);
    EXPECT_EQ(changed[0].generic_string(), "/a.js");
    EXPECT_EQ(changed[1].generic_string(), "/c.js");

    EXPECT_EQ((*read_file(graph, fs, "/a.js"))->bytes, "changed");
    EXPECT_EQ(file_kind(graph, fs, "/c.js"), FileKind::File);
}

TEST(FileSystemTest, DeletedFileIsInvalidated) {
    TaskGraph graph;
    MemoryFileSystem fs;
    fs.write("/a.js", "a");
    (void)read_file(graph, fs, "/a.js");

    fs.remove("/a.js");
    auto changed = invalidate_changed_files(graph, fs);
    ASSERT_EQ(changed.size(), 1u);
    EXPECT_FALSE(read_file(graph, fs, "/a.js")->has_value());
}

TEST(FileSystemTest, SeparateFileSystemsDoNotShareEntries) {
    TaskGraph graph;
    MemoryFileSystem one("one");
    MemoryFileSystem two("two");
    one.write("/a.js", "1");
    two.write("/a.js", "2");

    EXPECT_EQ((*read_file(graph, one, "/a.js"))->bytes, "1");
    EXPECT_EQ((*read_file(graph, two, "/a.js"))->bytes, "2");
}

TEST(FileSystemTest, DiskFileSystemReadsFiles) {
    auto dir = std::filesystem::temp_directory_path() / "quickpack_fs_test";
    std::filesystem::create_directories(dir);
    {
        std::ofstream out(dir / "file.js");
        out << "disk";
    }

    DiskFileSystem fs;
    EXPECT_EQ(fs.kind(dir), FileKind::Directory);
    EXPECT_EQ(fs.kind(dir / "file.js"), FileKind::File);
    EXPECT_EQ(fs.kind(dir / "none.js"), FileKind::Missing);

    auto content = fs.read(dir / "file.js");
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(content->bytes, "disk");
    EXPECT_EQ(content->digest, content_digest("disk"));
    EXPECT_TRUE(fs.revision(dir / "file.js").has_value());
    EXPECT_FALSE(fs.read(dir / "none.js").has_value());

    std::filesystem::remove_all(dir);
}
