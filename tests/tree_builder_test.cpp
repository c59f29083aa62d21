#include <gtest/gtest.h>
#include "../common/hash_utils.hpp"
#include "../common/ignore_matcher.hpp"
#include "../tree/tree_builder.hpp"
#include "memory_object_store.hpp"
#include "test_helpers.hpp"

TEST(TreeBuilderTest, LocalTreeHasRelativeSlashPaths) {
    TempDir dir;
    writeFile(dir.file("a.txt"), "alpha");
    writeFile(dir.file("sub/b.txt"), "bravo!");
    writeFile(dir.file("sub/deeper/c.bin"), "");
    setMtime(dir.file("a.txt"), 1600000000);

    Result<Tree> tree = buildLocalTree(dir.path(), IgnorePredicate(), true);
    ASSERT_TRUE(tree.success) << tree.message;
    ASSERT_EQ(tree.data.size(), 3u);

    const FileRecord& a = tree.data.at("a.txt");
    EXPECT_EQ(a.size, 5u);
    EXPECT_EQ(a.modTime, 1600000000);
    EXPECT_EQ(a.contentHash, HashUtils::md5Hex("alpha", 5));
    EXPECT_FALSE(a.isRemote);
    EXPECT_EQ(a.location, dir.file("a.txt"));

    EXPECT_EQ(tree.data.at("sub/b.txt").size, 6u);
    EXPECT_EQ(tree.data.count("sub/deeper/c.bin"), 1u);
}

TEST(TreeBuilderTest, HashingIsOptional) {
    TempDir dir;
    writeFile(dir.file("a.txt"), "alpha");
    Result<Tree> tree = buildLocalTree(dir.path(), IgnorePredicate(), false);
    ASSERT_TRUE(tree.success);
    EXPECT_TRUE(tree.data.at("a.txt").contentHash.empty());
}

TEST(TreeBuilderTest, LocalTreeSkipsIgnoredFilesAndDirectories) {
    TempDir dir;
    writeFile(dir.file("keep.txt"), "k");
    writeFile(dir.file("drop.log"), "d");
    writeFile(dir.file("build/out.o"), "o");
    writeFile(dir.file("src/main.cpp"), "m");

    IgnoreMatcher matcher;
    matcher.addPattern("*.log");
    matcher.addPattern("build/");
    Result<Tree> tree = buildLocalTree(dir.path(), matcher.predicate(), false);
    ASSERT_TRUE(tree.success);
    EXPECT_EQ(tree.data.size(), 2u);
    EXPECT_EQ(tree.data.count("keep.txt"), 1u);
    EXPECT_EQ(tree.data.count("src/main.cpp"), 1u);
}

TEST(TreeBuilderTest, MissingRootIsAnError) {
    Result<Tree> tree = buildLocalTree("/nonexistent/s3mirror/root", IgnorePredicate(), false);
    ASSERT_FALSE(tree.success);
    EXPECT_EQ(tree.code, ErrorCode::Io);
}

TEST(TreeBuilderTest, RemoteTreePagesAndStripsPrefix) {
    MemoryObjectStore store(2);
    store.putObject("backup/a.txt", "alpha", {}, 1700000100);
    store.putObject("backup/sub/b.txt", "bravo");
    store.putObject("backup/c.txt", "charlie");
    store.putObject("backup/", "");               // directory marker
    store.putObject("other/x.txt", "x");

    Result<Tree> tree = buildRemoteTree(store, "backup/", IgnorePredicate());
    ASSERT_TRUE(tree.success) << tree.message;
    EXPECT_EQ(tree.data.size(), 3u);
    EXPECT_GE(store.listCalls.load(), 2u);

    const FileRecord& a = tree.data.at("a.txt");
    EXPECT_TRUE(a.isRemote);
    EXPECT_EQ(a.size, 5u);
    EXPECT_EQ(a.modTime, 1700000100);
    EXPECT_EQ(a.contentHash, HashUtils::md5Hex("alpha", 5));
    EXPECT_EQ(a.location, "backup/a.txt");
    EXPECT_EQ(tree.data.count("sub/b.txt"), 1u);
}

TEST(TreeBuilderTest, RemoteKeysAreDecoded) {
    MemoryObjectStore store;
    store.encodeKeys = true;
    store.putObject("docs/my file.txt", "x");
    store.putObject("docs/a+b.txt", "y");

    Result<Tree> tree = buildRemoteTree(store, "docs/", IgnorePredicate());
    ASSERT_TRUE(tree.success);
    EXPECT_EQ(tree.data.count("my file.txt"), 1u);
    EXPECT_EQ(tree.data.count("a+b.txt"), 1u);
    EXPECT_EQ(tree.data.at("my file.txt").location, "docs/my file.txt");
}

TEST(TreeBuilderTest, RemoteTreeHonoursIgnore) {
    MemoryObjectStore store;
    store.putObject("p/keep.txt", "k");
    store.putObject("p/skip.tmp", "s");
    IgnoreMatcher matcher;
    matcher.addPattern("*.tmp");
    Result<Tree> tree = buildRemoteTree(store, "p/", matcher.predicate());
    ASSERT_TRUE(tree.success);
    EXPECT_EQ(tree.data.size(), 1u);
    EXPECT_EQ(tree.data.count("keep.txt"), 1u);
}

TEST(TreeBuilderTest, RemoteKeysThatLeaveTheRootAreSkipped) {
    MemoryObjectStore store;
    store.putObject("backup/ok.txt", "fine");
    store.putObject("backup/../../escaped.txt", "x");
    store.putObject("backup/a/../b.txt", "x");
    store.putObject("backup/sub/..", "x");
    store.putObject("backup/..%2F..%2Fencoded.txt", "x");

    Result<Tree> tree = buildRemoteTree(store, "backup/", IgnorePredicate());
    ASSERT_TRUE(tree.success) << tree.message;
    ASSERT_EQ(tree.data.size(), 1u);
    EXPECT_EQ(tree.data.count("ok.txt"), 1u);
}
