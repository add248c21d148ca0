#include <gtest/gtest.h>

#include "DestinationResolver.hpp"

namespace {
    DestinationTarget ResolveOk(const std::string& destination, const std::string& basename = "data.bin")
    {
        auto [ok, target, err] = DestinationResolver::Resolve(destination, basename);
        EXPECT_TRUE(ok) << destination << ": " << err.message;
        return target;
    }
}

TEST(DestinationResolverTest, BucketRootUsesSourceName)
{
    const DestinationTarget bare = ResolveOk("s3://bucket");
    EXPECT_EQ(bare.container, "bucket");
    EXPECT_EQ(bare.key, "data.bin");

    const DestinationTarget slash = ResolveOk("s3://bucket/");
    EXPECT_EQ(slash.container, "bucket");
    EXPECT_EQ(slash.key, "data.bin");
}

TEST(DestinationResolverTest, DirectoryPathAppendsSourceName)
{
    const DestinationTarget target = ResolveOk("s3://bucket/a/b/");
    EXPECT_EQ(target.container, "bucket");
    EXPECT_EQ(target.key, "a/b/data.bin");
}

TEST(DestinationResolverTest, FullPathIsKeptWithoutLeadingSlash)
{
    const DestinationTarget target = ResolveOk("s3://bucket/a/b/obj");
    EXPECT_EQ(target.container, "bucket");
    EXPECT_EQ(target.key, "a/b/obj");

    EXPECT_EQ(ResolveOk("s3://bucket//a/obj").key, "a/obj");
}

TEST(DestinationResolverTest, QueryAndFragmentAreIgnored)
{
    EXPECT_EQ(ResolveOk("s3://bucket/a/obj?versionId=3").key, "a/obj");
    EXPECT_EQ(ResolveOk("s3://bucket/dir/#frag").key, "dir/data.bin");
}

TEST(DestinationResolverTest, SchemeIsCaseInsensitive)
{
    EXPECT_EQ(ResolveOk("S3://bucket/obj").key, "obj");
}

TEST(DestinationResolverTest, RejectsOtherSchemes)
{
    for (const char* destination : { "http://bucket/obj", "/local/path", "bucket/obj", "s3:/bucket/obj", "" }) {
        auto [ok, target, err] = DestinationResolver::Resolve(destination, "data.bin");
        EXPECT_FALSE(ok) << destination;
        EXPECT_EQ(err.kind, UploadError::Kind::Configuration);
        EXPECT_NE(err.message.find("S3 url"), std::string::npos) << err.message;
    }
}

TEST(DestinationResolverTest, RejectsMissingBucket)
{
    auto [ok, target, err] = DestinationResolver::Resolve("s3:///obj", "data.bin");
    EXPECT_FALSE(ok);
    EXPECT_EQ(err.kind, UploadError::Kind::Configuration);
}
