#include <gtest/gtest.h>

#include <memory>
#include <sstream>

#include <grpcpp/grpcpp.h>

#include "GrpcStorageClient.hpp"
#include "ObjectStoreServiceImpl.hpp"
#include "TestUtil.hpp"
#include "UploadJob.hpp"

using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {
    constexpr uint64_t KiB = 1024;

    // Runs the object store in process, rooted in a temporary directory
    // holding a single container named "bucket".
    class ObjectStoreTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            root_ = dir_.Path() / "store";
            fs::create_directories(root_ / "bucket");

            config_.part_size = "50 KiB";
            config_.multipart_threshold = "50 KiB";
            config_.min_part_size = 0;
            config_.max_attempts = 2;
            config_.retry_delay = 1ms;

            content_ = MakeContent(120 * KiB);
            source_ = dir_.Path() / "data.bin";
            WriteFile(source_, content_);
        }

        void TearDown() override
        {
            if (server_)
                server_->Shutdown();
        }

        void Start(uint64_t min_part_size = 0)
        {
            service_ = std::make_unique<ObjectStoreServiceImpl>(root_.string(), min_part_size, NullLogger());
            ASSERT_TRUE(service_->IsValid());
            ASSERT_FALSE(service_->ResetStaging().has_value());

            grpc::ServerBuilder builder;
            builder.RegisterService(service_.get());
            server_ = builder.BuildAndStart();
            ASSERT_NE(server_, nullptr);

            client_ = std::make_unique<GrpcStorageClient>(server_->InProcessChannel(grpc::ChannelArguments()));
        }

        std::optional<UploadError> Run(const std::string& destination)
        {
            std::ostringstream progress;
            UploadJob job(*client_, config_, NullLogger(), [](std::chrono::milliseconds) {}, progress);
            return job.Run(source_, destination);
        }

        bool StagingIsEmpty() const
        {
            return fs::is_empty(root_ / ".multipart");
        }

        TempDir dir_;
        fs::path root_;
        fs::path source_;
        std::string content_;
        UploadConfig config_;

        std::unique_ptr<ObjectStoreServiceImpl> service_;
        std::unique_ptr<grpc::Server> server_;
        std::unique_ptr<GrpcStorageClient> client_;
    };
}

TEST_F(ObjectStoreTest, MultipartUploadAssemblesTheObject)
{
    Start();

    const auto err = Run("s3://bucket/dir/data.bin");

    ASSERT_FALSE(err.has_value()) << err->message;
    EXPECT_EQ(ReadFile(root_ / "bucket" / "dir" / "data.bin"), content_);
    EXPECT_TRUE(StagingIsEmpty());

    auto [ok, metadata, head_err] = client_->HeadObject("bucket", "dir/data.bin");
    ASSERT_TRUE(ok) << head_err.message;
    EXPECT_EQ(metadata.container(), "bucket");
    EXPECT_EQ(metadata.key(), "dir/data.bin");
    EXPECT_EQ(metadata.size(), content_.size());
}

TEST_F(ObjectStoreTest, DirectoryDestinationUsesFileName)
{
    Start();

    ASSERT_FALSE(Run("s3://bucket/backups/").has_value());
    EXPECT_EQ(ReadFile(root_ / "bucket" / "backups" / "data.bin"), content_);
}

TEST_F(ObjectStoreTest, SmallFileIsPutDirectly)
{
    Start();
    config_.multipart_threshold = "1 MiB";

    ASSERT_FALSE(Run("s3://bucket/small.bin").has_value());
    EXPECT_EQ(ReadFile(root_ / "bucket" / "small.bin"), content_);
    EXPECT_TRUE(StagingIsEmpty());
}

TEST_F(ObjectStoreTest, ExistingObjectIsKeptWithoutForce)
{
    Start();
    WriteFile(root_ / "bucket" / "data.bin", "old");

    const auto err = Run("s3://bucket/data.bin");

    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, UploadError::Kind::Precondition);
    EXPECT_EQ(ReadFile(root_ / "bucket" / "data.bin"), "old");
}

TEST_F(ObjectStoreTest, ForcedUploadsAreRepeatable)
{
    Start();
    config_.force = true;

    ASSERT_FALSE(Run("s3://bucket/data.bin").has_value());
    ASSERT_FALSE(Run("s3://bucket/data.bin").has_value());

    EXPECT_EQ(ReadFile(root_ / "bucket" / "data.bin"), content_);
    EXPECT_TRUE(StagingIsEmpty());
}

TEST_F(ObjectStoreTest, EmptyFileBecomesEmptyObject)
{
    Start();
    config_.multipart_threshold = "0";
    WriteFile(source_, "");

    ASSERT_FALSE(Run("s3://bucket/empty.bin").has_value());
    EXPECT_TRUE(fs::is_regular_file(root_ / "bucket" / "empty.bin"));
    EXPECT_EQ(fs::file_size(root_ / "bucket" / "empty.bin"), 0U);
}

TEST_F(ObjectStoreTest, MissingContainerIsReported)
{
    Start();

    auto [ok, exists, err] = client_->ContainerExists("nowhere");
    ASSERT_TRUE(ok) << err.message;
    EXPECT_FALSE(exists);

    const auto run_err = Run("s3://nowhere/data.bin");
    ASSERT_TRUE(run_err.has_value());
    EXPECT_EQ(run_err->kind, UploadError::Kind::Precondition);
}

TEST_F(ObjectStoreTest, MissingObjectIsNotAnError)
{
    Start();

    auto [ok, exists, err] = client_->ObjectExists("bucket", "nothing/here");
    ASSERT_TRUE(ok) << err.message;
    EXPECT_FALSE(exists);
}

TEST_F(ObjectStoreTest, CompleteRejectsForeignEtag)
{
    Start();

    auto [created, upload_id, create_err] = client_->CreateMultipartSession("bucket", "data.bin");
    ASSERT_TRUE(created) << create_err.message;

    auto [uploaded, etag, upload_err] = client_->UploadPart(upload_id, 1, "hello");
    ASSERT_TRUE(uploaded) << upload_err.message;

    auto err = client_->CompleteMultipartSession(upload_id, { { 1, "0000" } });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, static_cast<int>(grpc::StatusCode::INVALID_ARGUMENT));
    EXPECT_FALSE(fs::exists(root_ / "bucket" / "data.bin"));

    // The session survives a rejected completion.
    EXPECT_FALSE(client_->CompleteMultipartSession(upload_id, { { 1, etag } }).has_value());
    EXPECT_EQ(ReadFile(root_ / "bucket" / "data.bin"), "hello");
}

TEST_F(ObjectStoreTest, EtagIsPartDigest)
{
    Start();

    auto [created, upload_id, create_err] = client_->CreateMultipartSession("bucket", "data.bin");
    ASSERT_TRUE(created) << create_err.message;

    auto [uploaded, etag, upload_err] = client_->UploadPart(upload_id, 1, "abc");
    ASSERT_TRUE(uploaded) << upload_err.message;
    EXPECT_EQ(etag, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    EXPECT_FALSE(client_->AbortMultipartSession(upload_id).has_value());
}

TEST_F(ObjectStoreTest, AbortDropsStagedParts)
{
    Start();

    auto [created, upload_id, create_err] = client_->CreateMultipartSession("bucket", "data.bin");
    ASSERT_TRUE(created) << create_err.message;

    auto [uploaded, etag, upload_err] = client_->UploadPart(upload_id, 1, content_);
    ASSERT_TRUE(uploaded) << upload_err.message;
    EXPECT_FALSE(StagingIsEmpty());

    EXPECT_FALSE(client_->AbortMultipartSession(upload_id).has_value());
    EXPECT_TRUE(StagingIsEmpty());

    auto [after_ok, after_etag, after_err] = client_->UploadPart(upload_id, 2, "late");
    EXPECT_FALSE(after_ok);
    EXPECT_EQ(after_err.code, static_cast<int>(grpc::StatusCode::NOT_FOUND));
}

TEST_F(ObjectStoreTest, AbortOfUnknownUploadFails)
{
    Start();

    auto err = client_->AbortMultipartSession("no-such-upload");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, static_cast<int>(grpc::StatusCode::NOT_FOUND));
}

TEST_F(ObjectStoreTest, ServerEnforcesMinimumPartSize)
{
    Start(64 * KiB);

    auto [created, upload_id, create_err] = client_->CreateMultipartSession("bucket", "data.bin");
    ASSERT_TRUE(created) << create_err.message;

    auto [first_ok, first_etag, first_err] = client_->UploadPart(upload_id, 1, "tiny");
    ASSERT_TRUE(first_ok) << first_err.message;
    auto [second_ok, second_etag, second_err] = client_->UploadPart(upload_id, 2, "tail");
    ASSERT_TRUE(second_ok) << second_err.message;

    auto err = client_->CompleteMultipartSession(upload_id, { { 1, first_etag }, { 2, second_etag } });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, static_cast<int>(grpc::StatusCode::INVALID_ARGUMENT));

    // A lone undersized part is fine: it is the last one.
    EXPECT_FALSE(client_->CompleteMultipartSession(upload_id, { { 2, second_etag } }).has_value());
    EXPECT_EQ(ReadFile(root_ / "bucket" / "data.bin"), "tail");
}

TEST_F(ObjectStoreTest, RejectsKeysEscapingTheContainer)
{
    Start();

    auto [created, upload_id, err] = client_->CreateMultipartSession("bucket", "../outside");
    EXPECT_FALSE(created);
    EXPECT_EQ(err.code, static_cast<int>(grpc::StatusCode::INVALID_ARGUMENT));
}
