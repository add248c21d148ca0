#pragma once

#include "object_store.grpc.pb.h"
#include "object_store.pb.h"
#include "object.pb.h"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include <spdlog/spdlog.h>

#include "MultipartSession.hpp"

// ObjectStore backed by a directory: every container is a subdirectory of
// root_dir and every object a file below it. Objects are written to a
// temporary file and renamed into place, so readers never see partial data.
class ObjectStoreServiceImpl final : public ObjectStore::Service
{
public:
        ObjectStoreServiceImpl(const std::string_view root_dir, uint64_t min_part_size,
                               std::shared_ptr<spdlog::logger> logger);

public:
        bool IsValid() const noexcept;

        // Drops multipart uploads left over by a previous run.
        std::optional<std::string> ResetStaging() noexcept;

private:
        grpc::Status HeadContainer(grpc::ServerContext* context, const HeadContainerRequest* request, HeadContainerResponse* response) override;
        grpc::Status HeadObject(grpc::ServerContext* context, const HeadObjectRequest* request, HeadObjectResponse* response) override;
        grpc::Status PutObject(grpc::ServerContext* context, grpc::ServerReader<PutObjectRequest>* reader, PutObjectResponse* response) override;
        grpc::Status CreateMultipartUpload(grpc::ServerContext* context, const CreateMultipartUploadRequest* request, CreateMultipartUploadResponse* response) override;
        grpc::Status UploadPart(grpc::ServerContext* context, grpc::ServerReader<UploadPartRequest>* reader, UploadPartResponse* response) override;
        grpc::Status CompleteMultipartUpload(grpc::ServerContext* context, const CompleteMultipartUploadRequest* request, CompleteMultipartUploadResponse* response) override;
        grpc::Status AbortMultipartUpload(grpc::ServerContext* context, const AbortMultipartUploadRequest* request, AbortMultipartUploadResponse* response) override;

private:
        std::tuple<bool, std::filesystem::path, grpc::Status> ResolveContainer(const std::string& container) const;
        std::tuple<bool, std::filesystem::path, grpc::Status> ResolveObject(const std::string& container, const std::string& key) const;

        std::tuple<bool, std::shared_ptr<MultipartSession>, grpc::Status> FindSession(const std::string& upload_id);
        std::shared_ptr<MultipartSession> TakeSession(const std::string& upload_id);

        template <typename Request>
        std::tuple<bool, std::string, grpc::Status> ReceiveBody(grpc::ServerReader<Request>* reader,
                                                                const std::filesystem::path& out,
                                                                uint64_t expected, HashType hashtype) noexcept;

        std::tuple<bool, std::string, grpc::Status> Concatenate(const std::vector<MultipartSession::StoredPart>& parts,
                                                                const std::filesystem::path& out) noexcept;

        std::optional<grpc::Status> Publish(const std::filesystem::path& temp, const std::filesystem::path& target) noexcept;

private:
        const std::filesystem::path root_dir_;
        const std::filesystem::path staging_dir_;
        const uint64_t min_part_size_;
        std::shared_ptr<spdlog::logger> logger_;

        std::mutex sessions_mutex_;
        std::map<std::string, std::shared_ptr<MultipartSession>> sessions_;
};
