#include <gtest/gtest.h>
#include "../common/path_utils.hpp"

TEST(PathUtilsTest, QueryUnescapeDecodesPercentAndPlus) {
    EXPECT_EQ(PathUtils::queryUnescape("docs/my+file%281%29.txt"), "docs/my file(1).txt");
    EXPECT_EQ(PathUtils::queryUnescape("a%2Bb"), "a+b");
    EXPECT_EQ(PathUtils::queryUnescape("plain/key"), "plain/key");
}

TEST(PathUtilsTest, QueryUnescapeLeavesMalformedInputAlone) {
    EXPECT_EQ(PathUtils::queryUnescape("100%"), "100%");
    EXPECT_EQ(PathUtils::queryUnescape("bad%zzescape"), "bad%zzescape");
}

TEST(PathUtilsTest, UriEncodeKeepsUnreservedCharacters) {
    EXPECT_EQ(PathUtils::uriEncode("a-b_c.d~e", true), "a-b_c.d~e");
    EXPECT_EQ(PathUtils::uriEncode("dir/file name.txt", false), "dir/file%20name.txt");
    EXPECT_EQ(PathUtils::uriEncode("dir/file", true), "dir%2Ffile");
    EXPECT_EQ(PathUtils::uriEncode("\xc3\xa9", true), "%C3%A9");
}

TEST(PathUtilsTest, ParseS3UrlSplitsBucketAndKey) {
    Result<S3Location> loc = PathUtils::parseS3Url("s3://my-bucket/path/to/file.txt", "");
    ASSERT_TRUE(loc.success);
    EXPECT_EQ(loc.data.bucket, "my-bucket");
    EXPECT_EQ(loc.data.key, "path/to/file.txt");

    loc = PathUtils::parseS3Url("s3://my-bucket", "");
    ASSERT_TRUE(loc.success);
    EXPECT_EQ(loc.data.bucket, "my-bucket");
    EXPECT_EQ(loc.data.key, "");
}

TEST(PathUtilsTest, ParseS3UrlHonoursBucketOverride) {
    Result<S3Location> loc = PathUtils::parseS3Url("s3://other/key.txt", "forced");
    ASSERT_TRUE(loc.success);
    EXPECT_EQ(loc.data.bucket, "forced");
    EXPECT_EQ(loc.data.key, "other/key.txt");

    loc = PathUtils::parseS3Url("s3://forced/key.txt", "forced");
    ASSERT_TRUE(loc.success);
    EXPECT_EQ(loc.data.key, "key.txt");
}

TEST(PathUtilsTest, ParseS3UrlWithoutBucketIsConfigError) {
    Result<S3Location> loc = PathUtils::parseS3Url("s3:///key", "");
    ASSERT_FALSE(loc.success);
    EXPECT_EQ(loc.code, ErrorCode::Config);
}

TEST(PathUtilsTest, DirectoryPrefixAndBaseName) {
    EXPECT_EQ(PathUtils::directoryPrefix(""), "");
    EXPECT_EQ(PathUtils::directoryPrefix("backup"), "backup/");
    EXPECT_EQ(PathUtils::directoryPrefix("backup/"), "backup/");
    EXPECT_EQ(PathUtils::baseName("a/b/c.txt"), "c.txt");
    EXPECT_EQ(PathUtils::baseName("a/b/"), "b");
    EXPECT_EQ(PathUtils::baseName("c.txt"), "c.txt");
    EXPECT_TRUE(PathUtils::isS3Url("s3://x"));
    EXPECT_FALSE(PathUtils::isS3Url("/tmp/s3://x"));
}

TEST(PathUtilsTest, ContainedRelativePaths) {
    EXPECT_TRUE(PathUtils::isContainedRelative("a.txt"));
    EXPECT_TRUE(PathUtils::isContainedRelative("deep/er/file"));
    EXPECT_TRUE(PathUtils::isContainedRelative("dots..in..name"));
    EXPECT_TRUE(PathUtils::isContainedRelative("..hidden"));

    EXPECT_FALSE(PathUtils::isContainedRelative(""));
    EXPECT_FALSE(PathUtils::isContainedRelative("/etc/passwd"));
    EXPECT_FALSE(PathUtils::isContainedRelative(".."));
    EXPECT_FALSE(PathUtils::isContainedRelative("../escaped.txt"));
    EXPECT_FALSE(PathUtils::isContainedRelative("../../escaped.txt"));
    EXPECT_FALSE(PathUtils::isContainedRelative("a/../b"));
    EXPECT_FALSE(PathUtils::isContainedRelative("a/.."));
    EXPECT_FALSE(PathUtils::isContainedRelative("a\\..\\b"));
    EXPECT_FALSE(PathUtils::isContainedRelative("."));
}
