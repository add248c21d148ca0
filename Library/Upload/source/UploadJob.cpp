#include "UploadJob.hpp"

#include <system_error>

#include "fmt/core.h"

#include "FileStream.hpp"
#include "PartPlanner.hpp"
#include "PreflightChecker.hpp"
#include "ProgressReporter.hpp"
#include "SizeParser.hpp"

namespace fs = std::filesystem;

UploadJob::UploadJob(StorageClient& client, UploadConfig config,
                     std::shared_ptr<spdlog::logger> logger,
                     UploadOrchestrator::Sleeper sleeper,
                     std::ostream& progress_out)
    : client_(client)
    , config_(std::move(config))
    , logger_(logger ? std::move(logger) : spdlog::default_logger())
    , sleeper_(std::move(sleeper))
    , progress_out_(progress_out)
{
}

const DestinationTarget& UploadJob::GetTarget() const noexcept
{
    return target_;
}

std::tuple<bool, uint64_t, UploadError> UploadJob::InspectSource(const fs::path& source) const
{
    std::error_code ec;
    if (!fs::is_regular_file(source, ec))
        return { false, 0, MakeConfigurationError(fmt::format("Source is not a regular file: {}", source.string())) };

    const auto [ok, size, err] = FileStream(source).GetSize();
    if (!ok)
        return { false, 0, MakeConfigurationError(fmt::format("Cannot read size of {}: {}", source.string(), err.message)) };

    return { true, size, UploadError{} };
}

std::optional<UploadError> UploadJob::Run(const fs::path& source, const std::string& destination)
{
    const auto [source_ok, file_size, source_err] = InspectSource(source);
    if (!source_ok) {
        logger_->error(source_err.message);
        return source_err;
    }

    const auto [split_ok, part_size, split_err] = SizeParser::Parse(config_.part_size);
    if (!split_ok) {
        logger_->error(split_err.message);
        return split_err;
    }

    const auto [threshold_ok, threshold, threshold_err] = SizeParser::Parse(config_.multipart_threshold);
    if (!threshold_ok) {
        logger_->error(threshold_err.message);
        return threshold_err;
    }

    auto [resolved, target, resolve_err] = DestinationResolver::Resolve(destination, source.filename().string());
    if (!resolved) {
        logger_->error(resolve_err.message);
        return resolve_err;
    }
    target_ = std::move(target);

    PreflightChecker preflight(client_, logger_);
    if (auto err = preflight.Check(target_, config_.force))
        return err;

    UploadPlan plan;
    if (file_size >= threshold) {
        const PartPlanner::Limits limits{ config_.min_part_size, config_.max_part_count };
        auto [planned, parts, plan_err] = PartPlanner::Plan(file_size, part_size, limits);
        if (!planned) {
            logger_->error(plan_err.message);
            return plan_err;
        }
        plan = std::move(parts);
    } else {
        plan = PartPlanner::Whole(file_size);
    }

    logger_->debug("{} ({} bytes) -> {}/{} in {} part(s) of {} bytes",
                   source.string(), file_size, target_.container, target_.key, plan.size(), part_size);

    UploadOrchestrator::Options options;
    options.parallelism = config_.parallelism;
    options.max_attempts = config_.max_attempts;
    options.retry_delay = config_.retry_delay;
    options.multipart_threshold = threshold;

    std::unique_ptr<ProgressReporter> reporter;
    if (config_.verbose)
        reporter = std::make_unique<ProgressReporter>(source.string(), file_size, progress_out_);

    logger_->info("Starting upload");

    UploadOrchestrator orchestrator(client_, options, logger_, sleeper_);
    auto err = orchestrator.Upload(source, target_, plan, reporter.get());

    if (reporter)
        reporter->Finish();

    if (err)
        return err;

    logger_->info("Finished upload");

    return std::nullopt;
}
