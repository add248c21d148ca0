#pragma once

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "DestinationResolver.hpp"
#include "StorageClient.hpp"
#include "UploadConfig.hpp"
#include "UploadError.hpp"
#include "UploadOrchestrator.hpp"

// Sends one local file to an s3:// destination: resolves the object key,
// checks the bucket and any existing object, plans the parts and runs the
// upload with retries.
class UploadJob
{
public:
    UploadJob(StorageClient& client, UploadConfig config,
              std::shared_ptr<spdlog::logger> logger,
              UploadOrchestrator::Sleeper sleeper = UploadOrchestrator::DefaultSleeper(),
              std::ostream& progress_out = std::cout);

public:
    std::optional<UploadError> Run(const std::filesystem::path& source, const std::string& destination);

    // Valid once Run() has resolved the destination.
    const DestinationTarget& GetTarget() const noexcept;

private:
    std::tuple<bool, uint64_t, UploadError> InspectSource(const std::filesystem::path& source) const;

private:
    StorageClient& client_;
    const UploadConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    UploadOrchestrator::Sleeper sleeper_;
    std::ostream& progress_out_;

    DestinationTarget target_;
};
