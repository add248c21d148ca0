#include "MultipartSession.hpp"

#include <system_error>

#include "fmt/core.h"

namespace fs = std::filesystem;

namespace {
	grpc::Status Internal(std::string msg)
	{
		return grpc::Status(grpc::StatusCode::INTERNAL, std::move(msg));
	}

	grpc::Status InvalidPart(std::string msg)
	{
		return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, std::move(msg));
	}
}

MultipartSession::MultipartSession(std::string id, std::string container, std::string key, fs::path staging_dir)
	: id_(std::move(id))
	, container_(std::move(container))
	, key_(std::move(key))
	, staging_dir_(std::move(staging_dir))
{
}

const std::string& MultipartSession::GetId() const noexcept
{
	return id_;
}

const std::string& MultipartSession::GetContainer() const noexcept
{
	return container_;
}

const std::string& MultipartSession::GetKey() const noexcept
{
	return key_;
}

std::optional<grpc::Status> MultipartSession::CreateStaging() noexcept
{
	std::error_code ec;
	if (!fs::create_directories(staging_dir_, ec) && ec)
		return Internal(fmt::format("cannot create {}: {}", staging_dir_.string(), ec.message()));

	return std::nullopt;
}

fs::path MultipartSession::MakeTempPartPath(uint32_t part_number)
{
	return staging_dir_ / fmt::format("{}.part.{}", part_number, temp_counter_.fetch_add(1));
}

std::optional<grpc::Status> MultipartSession::CommitPart(uint32_t part_number, const fs::path& temp,
							 uint64_t size, std::string etag) noexcept
{
	const fs::path path = staging_dir_ / fmt::format("{}.part", part_number);

	std::lock_guard<std::mutex> lock(mutex_);

	std::error_code ec;
	fs::rename(temp, path, ec);
	if (ec)
		return Internal(fmt::format("cannot store part {}: {}", part_number, ec.message()));

	parts_[part_number] = StoredPart{ part_number, path, size, std::move(etag) };

	return std::nullopt;
}

std::tuple<bool, std::vector<MultipartSession::StoredPart>, grpc::Status> MultipartSession::SelectParts(
	const std::vector<std::pair<uint32_t, std::string>>& requested, uint64_t min_part_size) const
{
	if (requested.empty())
		return { false, {}, InvalidPart("complete request lists no parts") };

	std::lock_guard<std::mutex> lock(mutex_);

	std::vector<StoredPart> selected;
	selected.reserve(requested.size());

	uint32_t previous = 0;
	for (const auto& [part_number, etag] : requested) {
		if (part_number <= previous)
			return { false, {}, InvalidPart(fmt::format("part {} is out of order", part_number)) };
		previous = part_number;

		const auto it = parts_.find(part_number);
		if (it == parts_.end())
			return { false, {}, InvalidPart(fmt::format("part {} was never uploaded", part_number)) };

		if (it->second.etag != etag)
			return { false, {}, InvalidPart(fmt::format("part {} etag mismatch", part_number)) };

		selected.push_back(it->second);
	}

	for (size_t i = 0; i + 1 < selected.size(); i++)
		if (selected[i].size < min_part_size)
			return { false, {}, InvalidPart(fmt::format("part {} is smaller than {} bytes",
							selected[i].part_number, min_part_size)) };

	return { true, std::move(selected), grpc::Status::OK };
}

std::optional<grpc::Status> MultipartSession::Discard() noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);

	parts_.clear();

	std::error_code ec;
	fs::remove_all(staging_dir_, ec);
	if (ec)
		return Internal(fmt::format("cannot remove {}: {}", staging_dir_.string(), ec.message()));

	return std::nullopt;
}
