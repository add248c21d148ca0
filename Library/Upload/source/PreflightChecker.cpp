#include "PreflightChecker.hpp"

#include "fmt/core.h"

PreflightChecker::PreflightChecker(StorageClient& client, std::shared_ptr<spdlog::logger> logger)
    : client_(client)
    , logger_(std::move(logger))
{
}

std::optional<UploadError> PreflightChecker::Check(const DestinationTarget& target, bool force)
{
    if (auto err = CheckContainer(target.container))
        return err;

    if (auto err = CheckObject(target, force))
        return err;

    return std::nullopt;
}

std::optional<UploadError> PreflightChecker::CheckContainer(const std::string& container)
{
    const auto [ok, exists, err] = client_.ContainerExists(container);
    if (!ok) {
        logger_->error("Could not inspect s3 bucket {}!", container);
        return UploadError{ UploadError::Kind::Precondition, err.code,
            fmt::format("Could not inspect s3 bucket {}: {}", container, err.message) };
    }

    if (!exists) {
        logger_->error("s3 bucket {} does not exist!", container);
        return MakePreconditionError(fmt::format("s3 bucket {} does not exist", container));
    }

    return std::nullopt;
}

std::optional<UploadError> PreflightChecker::CheckObject(const DestinationTarget& target, bool force)
{
    const auto [ok, exists, err] = client_.ObjectExists(target.container, target.key);
    if (!ok) {
        logger_->error("Error checking for destination object!");
        return UploadError{ UploadError::Kind::Precondition, err.code,
            fmt::format("Error checking for destination object {}: {}", target.key, err.message) };
    }

    if (!exists)
        return std::nullopt;

    if (!force) {
        auto message = fmt::format("{} already exists in {}. Use --force to overwrite!", target.key, target.container);
        logger_->error(message);
        return MakePreconditionError(std::move(message));
    }

    logger_->debug("{} exists in {}, overwriting", target.key, target.container);

    return std::nullopt;
}
