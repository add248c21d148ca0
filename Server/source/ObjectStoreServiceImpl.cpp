#include "ObjectStoreServiceImpl.hpp"

#include <system_error>
#include <string_view>
#include <filesystem>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include <cstdio>

#include "openssl/rand.h"

#include "FileStream.hpp"
#include "HashingFileStream.hpp"
#include "Hasher.hpp"
#include "ObjectMetaData.hpp"

#include "grpcpp/support/status.h"

namespace fs = std::filesystem;

namespace {
	constexpr const char* kStagingDirName = ".multipart";

	static std::optional<Hasher::Type> MapHasherType(HashType t) noexcept
	{
		switch (t) {
		case HASH_TYPE_SHA256: return Hasher::Type::SHA256;
		case HASH_TYPE_SHA512: return Hasher::Type::SHA512;
		default: return std::nullopt;
		}
	}

	static grpc::Status InvalidArg(std::string msg)
	{
		return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, std::move(msg));
	}

	static grpc::Status NotFound(std::string msg)
	{
		return grpc::Status(grpc::StatusCode::NOT_FOUND, std::move(msg));
	}

	static grpc::Status Internal(std::string msg)
	{
		return grpc::Status(grpc::StatusCode::INTERNAL, std::move(msg));
	}

	static bool IsValidContainerName(std::string_view name) noexcept
	{
		return !name.empty()
			&& name.front() != '.'
			&& name.find('/') == std::string_view::npos
			&& name.find('\0') == std::string_view::npos;
	}

	// Keys map onto relative paths: no leading slash, no empty, "." or ".."
	// segments.
	static bool IsValidKey(std::string_view key) noexcept
	{
		if (key.empty() || key.find('\0') != std::string_view::npos)
			return false;

		size_t begin = 0;
		while (begin <= key.size()) {
			size_t end = key.find('/', begin);
			if (end == std::string_view::npos)
				end = key.size();

			const std::string_view segment = key.substr(begin, end - begin);
			if (segment.empty() || segment == "." || segment == "..")
				return false;

			begin = end + 1;
		}

		return true;
	}

	static std::optional<std::string> MakeUploadId()
	{
		unsigned char bytes[16];
		if (RAND_bytes(bytes, sizeof(bytes)) != 1)
			return std::nullopt;

		return Hasher::ToHex(std::vector<uint8_t>(bytes, bytes + sizeof(bytes)));
	}

	static void RemoveQuietly(const fs::path& path) noexcept
	{
		std::error_code ec;
		fs::remove(path, ec);
	}
}

ObjectStoreServiceImpl::ObjectStoreServiceImpl(const std::string_view root_dir, uint64_t min_part_size,
                                               std::shared_ptr<spdlog::logger> logger)
    : root_dir_(root_dir)
    , staging_dir_(root_dir_ / kStagingDirName)
    , min_part_size_(min_part_size)
    , logger_(logger ? std::move(logger) : spdlog::default_logger())
{
}

bool ObjectStoreServiceImpl::IsValid() const noexcept
{
    std::error_code ec;
    return !root_dir_.empty()
        && fs::exists(root_dir_, ec)
        && fs::is_directory(root_dir_, ec);
}

std::optional<std::string> ObjectStoreServiceImpl::ResetStaging() noexcept
{
    std::error_code ec;

    fs::remove_all(staging_dir_, ec);
    if (ec)
        return "cannot remove " + staging_dir_.string() + ": " + ec.message();

    fs::create_directories(staging_dir_, ec);
    if (ec)
        return "cannot create " + staging_dir_.string() + ": " + ec.message();

    return std::nullopt;
}

std::tuple<bool, fs::path, grpc::Status>
ObjectStoreServiceImpl::ResolveContainer(const std::string& container) const
{
    if (!IsValidContainerName(container))
        return { false, fs::path{}, InvalidArg("invalid container name: " + container) };

    const fs::path path = root_dir_ / container;

    std::error_code ec;
    if (!fs::is_directory(path, ec))
        return { false, path, NotFound("no such container: " + container) };

    return { true, path, grpc::Status::OK };
}

std::tuple<bool, fs::path, grpc::Status>
ObjectStoreServiceImpl::ResolveObject(const std::string& container, const std::string& key) const
{
    auto [ok, container_path, st] = ResolveContainer(container);
    if (!ok)
        return { false, fs::path{}, st };

    if (!IsValidKey(key))
        return { false, fs::path{}, InvalidArg("invalid key: " + key) };

    return { true, container_path / key, grpc::Status::OK };
}

std::tuple<bool, std::shared_ptr<MultipartSession>, grpc::Status>
ObjectStoreServiceImpl::FindSession(const std::string& upload_id)
{
    std::lock_guard<std::mutex> lock(sessions_mutex_);

    const auto it = sessions_.find(upload_id);
    if (it == sessions_.end())
        return { false, nullptr, NotFound("no such upload: " + upload_id) };

    return { true, it->second, grpc::Status::OK };
}

std::shared_ptr<MultipartSession> ObjectStoreServiceImpl::TakeSession(const std::string& upload_id)
{
    std::lock_guard<std::mutex> lock(sessions_mutex_);

    const auto it = sessions_.find(upload_id);
    if (it == sessions_.end())
        return nullptr;

    std::shared_ptr<MultipartSession> session = std::move(it->second);
    sessions_.erase(it);

    return session;
}

grpc::Status ObjectStoreServiceImpl::HeadContainer(grpc::ServerContext* context,
                                                   const HeadContainerRequest* request,
                                                   HeadContainerResponse* response)
{
    auto [exists, path, st] = ResolveContainer(request->container());
    if (!exists && st.error_code() != grpc::StatusCode::NOT_FOUND)
        return st;

    response->set_exists(exists);

    return grpc::Status::OK;
}

grpc::Status ObjectStoreServiceImpl::HeadObject(grpc::ServerContext* context,
                                                const HeadObjectRequest* request,
                                                HeadObjectResponse* response)
{
    auto [ok, path, st] = ResolveObject(request->container(), request->key());
    if (!ok)
        return st;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return NotFound("no such key: " + request->key());

    *response->mutable_metadata() = MakeObjectMetaDataFrom(path, request->container(), request->key(), "");

    return grpc::Status::OK;
}

template <typename Request>
std::tuple<bool, std::string, grpc::Status>
ObjectStoreServiceImpl::ReceiveBody(grpc::ServerReader<Request>* reader, const fs::path& out,
                                    uint64_t expected, HashType hashtype) noexcept
{
    const auto type = MapHasherType(hashtype);
    if (!type)
        return { false, "", InvalidArg("invalid hashtype") };

    HashingFileStream stream(out, *type);
    if (auto err = stream.Open(std::ios::binary | std::ios::out | std::ios::trunc))
        return { false, "", Internal("open failed: " + err->message) };

    const auto fail = [&](grpc::Status st) -> std::tuple<bool, std::string, grpc::Status> {
        if (auto err = stream.Close())
            logger_->debug("failed to close {}: {}", out.string(), err->message);
        RemoveQuietly(out);
        return { false, "", std::move(st) };
    };

    uint64_t total = 0;
    Request req;
    while (total < expected) {
        if (!reader->Read(&req))
            return fail(InvalidArg("stream ended before receiving size bytes"));

        if (req.request_case() != Request::kChunk)
            return fail(InvalidArg("expected a chunk message"));

        const DataChunk& chunk = req.chunk();
        if (chunk.offset() != total)
            return fail(InvalidArg("chunk offset does not follow the previous chunk"));

        const std::string& data = chunk.data();
        if (total + data.size() > expected)
            return fail(InvalidArg("received more bytes than size"));

        if (auto err = stream.Write(data))
            return fail(Internal("write failed: " + err->message));

        total += data.size();
    }

    if (!reader->Read(&req) || req.request_case() != Request::kFinish)
        return fail(InvalidArg("finish must follow the data"));

    if (!req.finish().has_hash())
        return fail(InvalidArg("finish carries no hash"));

    const Hash expected_hash = req.finish().hash();
    if (expected_hash.hashtype() != hashtype)
        return fail(InvalidArg("finish.hash.hashtype mismatch with init.hashtype"));

    Request extra;
    if (reader->Read(&extra))
        return fail(InvalidArg("extra messages after finish are not allowed"));

    if (auto err = stream.Close()) {
        RemoveQuietly(out);
        return { false, "", Internal("close failed: " + err->message) };
    }

    const auto digest = stream.GetHash();
    if (!digest || expected_hash.data() != std::string(digest->begin(), digest->end())) {
        RemoveQuietly(out);
        return { false, "", grpc::Status(grpc::StatusCode::DATA_LOSS, "hash mismatch") };
    }

    return { true, *stream.GetHashHex(), grpc::Status::OK };
}

std::optional<grpc::Status> ObjectStoreServiceImpl::Publish(const fs::path& temp, const fs::path& target) noexcept
{
    std::error_code ec;

    if (fs::is_directory(target, ec)) {
        RemoveQuietly(temp);
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "key names a directory: " + target.string());
    }

    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        RemoveQuietly(temp);
        return Internal("cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    fs::rename(temp, target, ec);
    if (ec) {
        RemoveQuietly(temp);
        return Internal("cannot publish " + target.string() + ": " + ec.message());
    }

    return std::nullopt;
}

grpc::Status ObjectStoreServiceImpl::PutObject(grpc::ServerContext* context,
                                               grpc::ServerReader<PutObjectRequest>* reader,
                                               PutObjectResponse* response)
{
    PutObjectRequest first;
    if (!reader->Read(&first))
        return InvalidArg("empty request stream");

    if (first.request_case() != PutObjectRequest::kInit)
        return InvalidArg("first message must be init");

    const PutObjectInit& init = first.init();

    auto [ok, target, st] = ResolveObject(init.container(), init.key());
    if (!ok)
        return st;

    const auto id = MakeUploadId();
    if (!id)
        return Internal("cannot generate a temporary name");

    const fs::path temp = staging_dir_ / ("put-" + *id);

    auto [received, etag, st_body] = ReceiveBody(reader, temp, init.size(), init.hashtype());
    if (!received)
        return st_body;

    if (auto err = Publish(temp, target))
        return *err;

    logger_->info("stored {}/{} ({} bytes)", init.container(), init.key(), init.size());

    *response->mutable_metadata() = MakeObjectMetaDataFrom(target, init.container(), init.key(), etag);

    return grpc::Status::OK;
}

grpc::Status ObjectStoreServiceImpl::CreateMultipartUpload(grpc::ServerContext* context,
                                                           const CreateMultipartUploadRequest* request,
                                                           CreateMultipartUploadResponse* response)
{
    auto [ok, target, st] = ResolveObject(request->container(), request->key());
    if (!ok)
        return st;

    const auto id = MakeUploadId();
    if (!id)
        return Internal("cannot generate an upload id");

    auto session = std::make_shared<MultipartSession>(*id, request->container(), request->key(), staging_dir_ / *id);
    if (auto err = session->CreateStaging())
        return *err;

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.emplace(*id, session);
    }

    logger_->debug("multipart upload {} created for {}/{}", *id, request->container(), request->key());

    response->set_upload_id(*id);

    return grpc::Status::OK;
}

grpc::Status ObjectStoreServiceImpl::UploadPart(grpc::ServerContext* context,
                                                grpc::ServerReader<UploadPartRequest>* reader,
                                                UploadPartResponse* response)
{
    UploadPartRequest first;
    if (!reader->Read(&first))
        return InvalidArg("empty request stream");

    if (first.request_case() != UploadPartRequest::kInit)
        return InvalidArg("first message must be init");

    const UploadPartInit& init = first.init();

    if (init.part_number() < 1 || init.part_number() > MultipartSession::kMaxPartNumber)
        return InvalidArg("part number must be between 1 and 10000");

    auto [found, session, st] = FindSession(init.upload_id());
    if (!found)
        return st;

    const fs::path temp = session->MakeTempPartPath(init.part_number());

    auto [received, etag, st_body] = ReceiveBody(reader, temp, init.size(), init.hashtype());
    if (!received)
        return st_body;

    if (auto err = session->CommitPart(init.part_number(), temp, init.size(), etag)) {
        RemoveQuietly(temp);
        return *err;
    }

    logger_->debug("multipart upload {}: part {} stored ({} bytes)", init.upload_id(), init.part_number(), init.size());

    response->set_etag(etag);

    return grpc::Status::OK;
}

std::tuple<bool, std::string, grpc::Status>
ObjectStoreServiceImpl::Concatenate(const std::vector<MultipartSession::StoredPart>& parts, const fs::path& out) noexcept
{
    HashingFileStream output(out, Hasher::Type::SHA256);
    if (auto err = output.Open(std::ios::binary | std::ios::out | std::ios::trunc))
        return { false, "", Internal("open failed: " + err->message) };

    const auto fail = [&](std::string msg) -> std::tuple<bool, std::string, grpc::Status> {
        if (auto err = output.Close())
            logger_->debug("failed to close {}: {}", out.string(), err->message);
        RemoveQuietly(out);
        return { false, "", Internal(std::move(msg)) };
    };

    constexpr std::size_t kChunkSize = 64 * BUFSIZ;
    std::string buffer(kChunkSize, '\0');

    for (const MultipartSession::StoredPart& part : parts) {
        FileStream input(part.path);
        if (auto err = input.Open(std::ios::binary | std::ios::in))
            return fail("open failed: " + err->message);

        uint64_t copied = 0;
        while (true) {
            const auto [ok, len, err] = input.Read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            if (!ok)
                return fail("read failed: " + err.message);

            if (len <= 0)
                break;

            if (auto werr = output.Write(std::string_view(buffer.data(), static_cast<size_t>(len))))
                return fail("write failed: " + werr->message);

            copied += static_cast<uint64_t>(len);
        }

        if (auto err = input.Close())
            return fail("close failed: " + err->message);

        if (copied != part.size)
            return fail("part " + std::to_string(part.part_number) + " changed size on disk");
    }

    if (auto err = output.Close()) {
        RemoveQuietly(out);
        return { false, "", Internal("close failed: " + err->message) };
    }

    return { true, *output.GetHashHex(), grpc::Status::OK };
}

grpc::Status ObjectStoreServiceImpl::CompleteMultipartUpload(grpc::ServerContext* context,
                                                             const CompleteMultipartUploadRequest* request,
                                                             CompleteMultipartUploadResponse* response)
{
    auto [found, session, st] = FindSession(request->upload_id());
    if (!found)
        return st;

    std::vector<std::pair<uint32_t, std::string>> requested;
    requested.reserve(request->parts_size());
    for (const ::CompletedPart& part : request->parts())
        requested.emplace_back(part.part_number(), part.etag());

    auto [selected, parts, st_parts] = session->SelectParts(requested, min_part_size_);
    if (!selected)
        return st_parts;

    auto [resolved, target, st_target] = ResolveObject(session->GetContainer(), session->GetKey());
    if (!resolved)
        return st_target;

    const fs::path temp = staging_dir_ / (session->GetId() + ".object");

    auto [assembled, etag, st_concat] = Concatenate(parts, temp);
    if (!assembled)
        return st_concat;

    if (!TakeSession(request->upload_id())) {
        RemoveQuietly(temp);
        return NotFound("upload was completed or aborted concurrently: " + request->upload_id());
    }

    if (auto err = Publish(temp, target))
        return *err;

    if (auto err = session->Discard())
        logger_->warn("multipart upload {}: {}", session->GetId(), err->error_message());

    logger_->info("stored {}/{} from {} parts", session->GetContainer(), session->GetKey(), parts.size());

    *response->mutable_metadata() = MakeObjectMetaDataFrom(target, session->GetContainer(), session->GetKey(), etag);

    return grpc::Status::OK;
}

grpc::Status ObjectStoreServiceImpl::AbortMultipartUpload(grpc::ServerContext* context,
                                                          const AbortMultipartUploadRequest* request,
                                                          AbortMultipartUploadResponse* response)
{
    std::shared_ptr<MultipartSession> session = TakeSession(request->upload_id());
    if (!session)
        return NotFound("no such upload: " + request->upload_id());

    if (auto err = session->Discard())
        return *err;

    logger_->debug("multipart upload {} aborted", request->upload_id());

    return grpc::Status::OK;
}
