#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <grpcpp/support/status.h>

// Parts received for one multipart upload, staged as files under
// <root>/.multipart/<id>/ until the upload is completed or aborted.
class MultipartSession
{
public:
	struct StoredPart {
		uint32_t part_number;
		std::filesystem::path path;
		uint64_t size;
		std::string etag;
	};

	static constexpr uint32_t kMaxPartNumber = 10000;

public:
	MultipartSession(std::string id, std::string container, std::string key, std::filesystem::path staging_dir);

public:
	const std::string& GetId() const noexcept;
	const std::string& GetContainer() const noexcept;
	const std::string& GetKey() const noexcept;

	std::optional<grpc::Status> CreateStaging() noexcept;

	// Unique file to receive a part before it is committed.
	std::filesystem::path MakeTempPartPath(uint32_t part_number);

	// Replaces any earlier upload of the same part number.
	std::optional<grpc::Status> CommitPart(uint32_t part_number, const std::filesystem::path& temp, uint64_t size, std::string etag) noexcept;

	// Parts named by a complete request, checked against what was stored:
	// ascending part numbers, matching etags, every part but the last at
	// least min_part_size bytes.
	std::tuple<bool, std::vector<StoredPart>, grpc::Status> SelectParts(
		const std::vector<std::pair<uint32_t, std::string>>& requested, uint64_t min_part_size) const;

	std::optional<grpc::Status> Discard() noexcept;

private:
	const std::string id_;
	const std::string container_;
	const std::string key_;
	const std::filesystem::path staging_dir_;

	mutable std::mutex mutex_;
	std::map<uint32_t, StoredPart> parts_;
	std::atomic<uint64_t> temp_counter_{ 0 };
};
