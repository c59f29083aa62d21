#include <gtest/gtest.h>
#include "../sync/copy_engine.hpp"
#include "memory_object_store.hpp"
#include "test_helpers.hpp"
#include <set>

namespace {

SyncOptions copyOptions() {
    SyncOptions options;
    options.maxWorkers = 2;
    options.transfer.attempts = 1;
    return options;
}

std::set<std::string> asSet(const std::vector<std::string>& v) {
    return std::set<std::string>(v.begin(), v.end());
}

}

TEST(UploadKeyTest, DirectoryKeysTakeTheFileName) {
    EXPECT_EQ(uploadKeyFor("", "/tmp/a.txt"), "a.txt");
    EXPECT_EQ(uploadKeyFor("/", "/tmp/a.txt"), "a.txt");
    EXPECT_EQ(uploadKeyFor("docs/", "/tmp/a.txt"), "docs/a.txt");
    EXPECT_EQ(uploadKeyFor("docs/renamed.txt", "/tmp/a.txt"), "docs/renamed.txt");
}

TEST(CopyEngineTest, SingleFileUpload) {
    TempDir dir;
    writeFile(dir.file("a.txt"), "alpha");
    MemoryObjectStore store;

    CopyEngine engine(store, copyOptions());
    SyncReport report;
    ASSERT_TRUE(engine.upload(CancelToken(), dir.file("a.txt"), "docs/", report).success);
    EXPECT_EQ(store.object("docs/a.txt").data, "alpha");
    EXPECT_EQ(report.uploaded(), std::vector<std::string>{"docs/a.txt"});
}

TEST(CopyEngineTest, DirectoryNeedsRecursive) {
    TempDir dir;
    writeFile(dir.file("a.txt"), "alpha");
    MemoryObjectStore store;

    CopyEngine engine(store, copyOptions());
    SyncReport report;
    Result<void> r = engine.upload(CancelToken(), dir.path(), "docs", report);
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.code, ErrorCode::Config);
    EXPECT_EQ(store.putCalls.load(), 0u);
}

TEST(CopyEngineTest, RecursiveUploadHonoursIgnores) {
    TempDir dir;
    writeFile(dir.file("a.txt"), "alpha");
    writeFile(dir.file("sub/b.txt"), "bravo");
    writeFile(dir.file("sub/debug.log"), "noise");
    writeFile(dir.file("cache/c.txt"), "cached");
    MemoryObjectStore store;

    IgnoreMatcher matcher;
    matcher.addPattern("*.log");
    matcher.addPattern("cache/");
    SyncOptions options = copyOptions();
    options.recursive = true;
    options.ignore = matcher.predicate();

    CopyEngine engine(store, options);
    SyncReport report;
    ASSERT_TRUE(engine.upload(CancelToken(), dir.path(), "backup", report).success);
    EXPECT_EQ(store.keys(), (std::set<std::string>{"backup/a.txt", "backup/sub/b.txt"}));
    EXPECT_EQ(asSet(report.uploaded()), (std::set<std::string>{"backup/a.txt", "backup/sub/b.txt"}));
}

TEST(CopyEngineTest, CopyNeverDeletesAndSkipsMatches) {
    TempDir dir;
    writeFile(dir.file("a.txt"), "alpha");
    MemoryObjectStore store;
    store.putObject("backup/a.txt", "alpha");
    store.putObject("backup/extra.txt", "extra");

    SyncOptions options = copyOptions();
    options.recursive = true;
    CopyEngine engine(store, options);
    SyncReport report;
    ASSERT_TRUE(engine.upload(CancelToken(), dir.path(), "backup/", report).success);
    EXPECT_TRUE(store.contains("backup/extra.txt"));
    EXPECT_TRUE(report.uploaded().empty());
    EXPECT_EQ(store.putCalls.load(), 0u);

    options.force = true;
    CopyEngine forced(store, options);
    SyncReport again;
    ASSERT_TRUE(forced.upload(CancelToken(), dir.path(), "backup/", again).success);
    EXPECT_EQ(again.uploaded(), std::vector<std::string>{"backup/a.txt"});
}

TEST(CopyEngineTest, FailedFileInDirectoryIsReported) {
    TempDir dir;
    writeFile(dir.file("a.txt"), "alpha");
    writeFile(dir.file("b.txt"), "bravo");
    MemoryObjectStore store;
    store.failingPuts.insert("b.txt");

    SyncOptions options = copyOptions();
    options.recursive = true;
    CopyEngine engine(store, options);
    SyncReport report;
    ASSERT_TRUE(engine.upload(CancelToken(), dir.path(), "", report).success);
    EXPECT_TRUE(store.contains("a.txt"));
    ASSERT_EQ(report.errors().size(), 1u);
    EXPECT_NE(report.errors()[0].find("b.txt"), std::string::npos);
}

TEST(CopyEngineTest, SingleFileFailureIsFatal) {
    TempDir dir;
    writeFile(dir.file("a.txt"), "alpha");
    MemoryObjectStore store;
    store.failingPuts.insert("a.txt");

    CopyEngine engine(store, copyOptions());
    SyncReport report;
    Result<void> r = engine.upload(CancelToken(), dir.file("a.txt"), "", report);
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.code, ErrorCode::Remote);
}

TEST(CopyEngineTest, DownloadSingleObjectIntoDirectory) {
    TempDir dir;
    MemoryObjectStore store;
    store.putObject("docs/a.txt", "alpha");

    CopyEngine engine(store, copyOptions());
    SyncReport report;
    ASSERT_TRUE(engine.download(CancelToken(), "docs/a.txt", dir.path() + "/", report).success);
    EXPECT_EQ(readFile(dir.file("a.txt")), "alpha");

    ASSERT_TRUE(engine.download(CancelToken(), "docs/a.txt", dir.file("renamed.txt"), report).success);
    EXPECT_EQ(readFile(dir.file("renamed.txt")), "alpha");
}

TEST(CopyEngineTest, DownloadPrefix) {
    TempDir dir;
    MemoryObjectStore store;
    store.putObject("docs/a.txt", "alpha");
    store.putObject("docs/deep/b.txt", "bravo");
    store.putObject("other/c.txt", "charlie");

    CopyEngine engine(store, copyOptions());
    SyncReport report;
    std::string dest = dir.file("out");
    ASSERT_TRUE(engine.download(CancelToken(), "docs", dest, report).success);
    EXPECT_EQ(readFile(dest + "/a.txt"), "alpha");
    EXPECT_EQ(readFile(dest + "/deep/b.txt"), "bravo");
    EXPECT_FALSE(fs::exists(dest + "/c.txt"));
    EXPECT_EQ(asSet(report.downloaded()), (std::set<std::string>{"docs/a.txt", "docs/deep/b.txt"}));
}

TEST(CopyEngineTest, DownloadPrefixSkipsEscapingKeys) {
    TempDir dir;
    MemoryObjectStore store;
    store.putObject("docs/a.txt", "alpha");
    store.putObject("docs/../../escaped.txt", "x");

    CopyEngine engine(store, copyOptions());
    SyncReport report;
    std::string dest = dir.file("one/two");
    ASSERT_TRUE(engine.download(CancelToken(), "docs/", dest, report).success);
    EXPECT_EQ(report.downloaded(), std::vector<std::string>{"docs/a.txt"});
    EXPECT_FALSE(fs::exists(dir.file("escaped.txt")));
}

TEST(CopyEngineTest, SingleObjectNeedsAFileName) {
    TempDir dir;
    MemoryObjectStore store;
    store.putObject("docs/..", "x");

    CopyEngine engine(store, copyOptions());
    SyncReport report;
    Result<void> r = engine.download(CancelToken(), "docs/..", dir.path(), report);
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.code, ErrorCode::Config);
    EXPECT_TRUE(entriesOf(dir.path()).empty());
}

TEST(CopyEngineTest, DownloadOfNothingIsNotFound) {
    TempDir dir;
    MemoryObjectStore store;
    CopyEngine engine(store, copyOptions());
    SyncReport report;
    Result<void> r = engine.download(CancelToken(), "missing/", dir.file("out"), report);
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.code, ErrorCode::NotFound);
}

TEST(CopyEngineTest, DryRunTouchesNothing) {
    TempDir dir;
    writeFile(dir.file("a.txt"), "alpha");
    MemoryObjectStore store;
    store.putObject("docs/b.txt", "bravo");

    SyncOptions options = copyOptions();
    options.recursive = true;
    options.dryRun = true;
    CopyEngine engine(store, options);

    SyncReport up;
    ASSERT_TRUE(engine.upload(CancelToken(), dir.path(), "docs/", up).success);
    EXPECT_EQ(up.uploaded(), std::vector<std::string>{"docs/a.txt"});

    SyncReport down;
    ASSERT_TRUE(engine.download(CancelToken(), "docs/", dir.file("out"), down).success);
    EXPECT_EQ(down.downloaded(), std::vector<std::string>{"docs/b.txt"});

    EXPECT_EQ(store.mutations(), 0u);
    EXPECT_EQ(store.getCalls.load(), 0u);
    EXPECT_FALSE(fs::exists(dir.file("out")));
}
