#include "GrpcStorageClient.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>

#include <grpcpp/grpcpp.h>

#include "Hasher.hpp"

namespace {
	StorageClient::Error OkError()
	{
		return StorageClient::Error{ 0, "" };
	}

	StorageClient::Error MakeErr(int code, std::string msg)
	{
		return StorageClient::Error{ code, std::move(msg) };
	}

	StorageClient::Error MakeGrpcErr(const grpc::Status& st)
	{
		return StorageClient::Error{ static_cast<int>(st.error_code()), st.error_message() };
	}

	std::tuple<bool, Hash, StorageClient::Error> MakeHash(std::string_view data)
	{
		Hasher hasher(Hasher::Type::SHA256);

		if (auto err = hasher.Initialize())
			return { false, Hash{}, MakeErr(err->code, "hasher: " + err->message) };

		if (auto err = hasher.Update(data))
			return { false, Hash{}, MakeErr(err->code, "hasher: " + err->message) };

		auto [ok, digest, err] = hasher.Finalize();
		if (!ok)
			return { false, Hash{}, MakeErr(err.code, "hasher: " + err.message) };

		Hash hash;
		hash.set_hashtype(HASH_TYPE_SHA256);
		hash.set_data(digest.data(), digest.size());

		return { true, std::move(hash), OkError() };
	}

	// Writes data as chunk messages followed by the finish message. When a
	// write fails the stream is finished to fetch the server's status.
	template <typename Request>
	std::optional<StorageClient::Error> SendBody(grpc::ClientWriter<Request>& writer, std::string_view data, const Hash& hash)
	{
		constexpr std::size_t kChunkSize = 64 * BUFSIZ;

		std::uint64_t offset = 0;
		while (offset < data.size()) {
			const std::size_t len = std::min<std::size_t>(kChunkSize, data.size() - offset);

			Request req;
			DataChunk* chunk = req.mutable_chunk();
			chunk->set_data(data.data() + offset, len);
			chunk->set_offset(offset);

			if (!writer.Write(req))
				return MakeGrpcErr(writer.Finish());

			offset += len;
		}

		Request req;
		*req.mutable_finish()->mutable_hash() = hash;
		if (!writer.Write(req))
			return MakeGrpcErr(writer.Finish());

		writer.WritesDone();

		return std::nullopt;
	}
}

GrpcStorageClient::GrpcStorageClient(std::shared_ptr<grpc::Channel> channel)
    : stub_(ObjectStore::NewStub(std::move(channel)))
{
}

std::tuple<bool, bool, StorageClient::Error>
GrpcStorageClient::ContainerExists(const std::string& container)
{
    grpc::ClientContext ctx;
    HeadContainerRequest req;
    HeadContainerResponse resp;

    req.set_container(container);

    grpc::Status st = stub_->HeadContainer(&ctx, req, &resp);
    if (!st.ok())
        return { false, false, MakeGrpcErr(st) };

    return { true, resp.exists(), OkError() };
}

std::tuple<bool, ObjectMetaData, StorageClient::Error>
GrpcStorageClient::HeadObject(const std::string& container, const std::string& key)
{
    grpc::ClientContext ctx;
    HeadObjectRequest req;
    HeadObjectResponse resp;

    req.set_container(container);
    req.set_key(key);

    grpc::Status st = stub_->HeadObject(&ctx, req, &resp);
    if (!st.ok())
        return { false, ObjectMetaData{}, MakeGrpcErr(st) };

    return { true, resp.metadata(), OkError() };
}

std::tuple<bool, bool, StorageClient::Error>
GrpcStorageClient::ObjectExists(const std::string& container, const std::string& key)
{
    auto [ok, metadata, err] = HeadObject(container, key);
    if (ok)
        return { true, true, OkError() };

    if (err.code == static_cast<int>(grpc::StatusCode::NOT_FOUND))
        return { true, false, OkError() };

    return { false, false, err };
}

std::tuple<bool, std::string, StorageClient::Error>
GrpcStorageClient::CreateMultipartSession(const std::string& container, const std::string& key)
{
    grpc::ClientContext ctx;
    CreateMultipartUploadRequest req;
    CreateMultipartUploadResponse resp;

    req.set_container(container);
    req.set_key(key);

    grpc::Status st = stub_->CreateMultipartUpload(&ctx, req, &resp);
    if (!st.ok())
        return { false, "", MakeGrpcErr(st) };

    if (resp.upload_id().empty())
        return { false, "", MakeErr(-1, "server returned an empty upload id") };

    return { true, resp.upload_id(), OkError() };
}

std::tuple<bool, std::string, StorageClient::Error>
GrpcStorageClient::UploadPart(const std::string& session_id, uint32_t index, std::string_view data)
{
    auto [hashed, hash, herr] = MakeHash(data);
    if (!hashed)
        return { false, "", herr };

    grpc::ClientContext ctx;
    UploadPartResponse resp;

    std::unique_ptr<grpc::ClientWriter<UploadPartRequest>> writer = stub_->UploadPart(&ctx, &resp);
    if (!writer)
        return { false, "", MakeErr(-1, "failed to create ClientWriter") };

    UploadPartRequest req;
    UploadPartInit* init = req.mutable_init();
    init->set_upload_id(session_id);
    init->set_part_number(index);
    init->set_size(data.size());
    init->set_hashtype(HASH_TYPE_SHA256);

    if (!writer->Write(req))
        return { false, "", MakeGrpcErr(writer->Finish()) };

    if (auto err = SendBody(*writer, data, hash))
        return { false, "", *err };

    grpc::Status st = writer->Finish();
    if (!st.ok())
        return { false, "", MakeGrpcErr(st) };

    if (resp.etag().empty())
        return { false, "", MakeErr(-1, "server returned an empty etag") };

    return { true, resp.etag(), OkError() };
}

std::optional<StorageClient::Error>
GrpcStorageClient::CompleteMultipartSession(const std::string& session_id, const std::vector<CompletedPart>& parts)
{
    grpc::ClientContext ctx;
    CompleteMultipartUploadRequest req;
    CompleteMultipartUploadResponse resp;

    req.set_upload_id(session_id);
    for (const CompletedPart& part : parts) {
        ::CompletedPart* out = req.add_parts();
        out->set_part_number(part.index);
        out->set_etag(part.token);
    }

    grpc::Status st = stub_->CompleteMultipartUpload(&ctx, req, &resp);
    if (!st.ok())
        return MakeGrpcErr(st);

    return std::nullopt;
}

std::optional<StorageClient::Error>
GrpcStorageClient::AbortMultipartSession(const std::string& session_id)
{
    grpc::ClientContext ctx;
    AbortMultipartUploadRequest req;
    AbortMultipartUploadResponse resp;

    req.set_upload_id(session_id);

    grpc::Status st = stub_->AbortMultipartUpload(&ctx, req, &resp);
    if (!st.ok())
        return MakeGrpcErr(st);

    return std::nullopt;
}

std::optional<StorageClient::Error>
GrpcStorageClient::PutObjectDirect(const std::string& container, const std::string& key, std::string_view data)
{
    auto [hashed, hash, herr] = MakeHash(data);
    if (!hashed)
        return herr;

    grpc::ClientContext ctx;
    PutObjectResponse resp;

    std::unique_ptr<grpc::ClientWriter<PutObjectRequest>> writer = stub_->PutObject(&ctx, &resp);
    if (!writer)
        return MakeErr(-1, "failed to create ClientWriter");

    PutObjectRequest req;
    PutObjectInit* init = req.mutable_init();
    init->set_container(container);
    init->set_key(key);
    init->set_size(data.size());
    init->set_hashtype(HASH_TYPE_SHA256);

    if (!writer->Write(req))
        return MakeGrpcErr(writer->Finish());

    if (auto err = SendBody(*writer, data, hash))
        return err;

    grpc::Status st = writer->Finish();
    if (!st.ok())
        return MakeGrpcErr(st);

    return std::nullopt;
}
