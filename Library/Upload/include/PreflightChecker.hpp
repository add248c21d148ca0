#pragma once

#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

#include "DestinationResolver.hpp"
#include "StorageClient.hpp"
#include "UploadError.hpp"

class PreflightChecker
{
public:
	PreflightChecker(StorageClient& client, std::shared_ptr<spdlog::logger> logger);

public:
	// Fails when the container cannot be inspected or when the object already
	// exists and overwriting was not requested. Nothing here is retried.
	std::optional<UploadError> Check(const DestinationTarget& target, bool force);

private:
	std::optional<UploadError> CheckContainer(const std::string& container);
	std::optional<UploadError> CheckObject(const DestinationTarget& target, bool force);

private:
	StorageClient& client_;
	std::shared_ptr<spdlog::logger> logger_;
};
