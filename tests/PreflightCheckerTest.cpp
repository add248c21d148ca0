#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "MockStorageClient.hpp"
#include "PreflightChecker.hpp"
#include "TestUtil.hpp"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;

namespace {
    const DestinationTarget kTarget{ "bucket", "dir/data.bin" };

    MockStorageClient::BoolResult Exists(bool exists)
    {
        return { true, exists, StorageClient::Error{} };
    }

    MockStorageClient::BoolResult Fails(int code, const std::string& message)
    {
        return { false, false, StorageClient::Error{ code, message } };
    }
}

TEST(PreflightCheckerTest, PassesWhenObjectIsMissing)
{
    MockStorageClient client;
    EXPECT_CALL(client, ContainerExists("bucket")).WillOnce(Return(Exists(true)));
    EXPECT_CALL(client, ObjectExists("bucket", "dir/data.bin")).WillOnce(Return(Exists(false)));

    PreflightChecker checker(client, NullLogger());
    EXPECT_FALSE(checker.Check(kTarget, false).has_value());
}

TEST(PreflightCheckerTest, MissingContainerIsFatal)
{
    MockStorageClient client;
    EXPECT_CALL(client, ContainerExists("bucket")).WillOnce(Return(Exists(false)));
    EXPECT_CALL(client, ObjectExists(_, _)).Times(0);

    PreflightChecker checker(client, NullLogger());
    const auto err = checker.Check(kTarget, true);

    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, UploadError::Kind::Precondition);
    EXPECT_THAT(err->message, HasSubstr("bucket"));
}

TEST(PreflightCheckerTest, ContainerProbeFailureIsNotRetried)
{
    MockStorageClient client;
    EXPECT_CALL(client, ContainerExists("bucket")).Times(1).WillOnce(Return(Fails(14, "unavailable")));

    PreflightChecker checker(client, NullLogger());
    const auto err = checker.Check(kTarget, false);

    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, UploadError::Kind::Precondition);
    EXPECT_EQ(err->code, 14);
    EXPECT_THAT(err->message, HasSubstr("unavailable"));
}

TEST(PreflightCheckerTest, ExistingObjectNeedsForce)
{
    MockStorageClient client;
    EXPECT_CALL(client, ContainerExists("bucket")).WillOnce(Return(Exists(true)));
    EXPECT_CALL(client, ObjectExists("bucket", "dir/data.bin")).WillOnce(Return(Exists(true)));

    PreflightChecker checker(client, NullLogger());
    const auto err = checker.Check(kTarget, false);

    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, UploadError::Kind::Precondition);
    EXPECT_THAT(err->message, HasSubstr("dir/data.bin already exists in bucket"));
}

TEST(PreflightCheckerTest, ForceAllowsOverwrite)
{
    MockStorageClient client;
    EXPECT_CALL(client, ContainerExists("bucket")).WillOnce(Return(Exists(true)));
    EXPECT_CALL(client, ObjectExists("bucket", "dir/data.bin")).WillOnce(Return(Exists(true)));

    PreflightChecker checker(client, NullLogger());
    EXPECT_FALSE(checker.Check(kTarget, true).has_value());
}

TEST(PreflightCheckerTest, ObjectProbeFailureIsFatal)
{
    MockStorageClient client;
    EXPECT_CALL(client, ContainerExists("bucket")).WillOnce(Return(Exists(true)));
    EXPECT_CALL(client, ObjectExists("bucket", "dir/data.bin")).WillOnce(Return(Fails(7, "denied")));

    PreflightChecker checker(client, NullLogger());
    const auto err = checker.Check(kTarget, true);

    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, UploadError::Kind::Precondition);
    EXPECT_THAT(err->message, HasSubstr("denied"));
}
