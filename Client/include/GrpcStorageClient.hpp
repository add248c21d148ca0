#pragma once

#include "object_store.grpc.pb.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "object_store.pb.h"
#include "object.pb.h"
#include "hash.pb.h"

#include "StorageClient.hpp"

// StorageClient speaking the ObjectStore gRPC protocol. Object data is
// streamed in chunks followed by its SHA-256 digest.
class GrpcStorageClient final : public StorageClient
{
public:
    explicit GrpcStorageClient(std::shared_ptr<grpc::Channel> channel);

public:
    std::tuple<bool, bool, Error> ContainerExists(const std::string& container) override;
    std::tuple<bool, bool, Error> ObjectExists(const std::string& container, const std::string& key) override;

    std::tuple<bool, std::string, Error> CreateMultipartSession(const std::string& container, const std::string& key) override;
    std::tuple<bool, std::string, Error> UploadPart(const std::string& session_id, uint32_t index, std::string_view data) override;
    std::optional<Error> CompleteMultipartSession(const std::string& session_id, const std::vector<CompletedPart>& parts) override;
    std::optional<Error> AbortMultipartSession(const std::string& session_id) override;

    std::optional<Error> PutObjectDirect(const std::string& container, const std::string& key, std::string_view data) override;

public:
    // NOT_FOUND is reported as an error with code grpc::StatusCode::NOT_FOUND.
    std::tuple<bool, ObjectMetaData, Error> HeadObject(const std::string& container, const std::string& key);

private:
    std::unique_ptr<ObjectStore::Stub> stub_;
};
