#include "UploadOrchestrator.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

#include "fmt/core.h"
#include "fmt/chrono.h"

#include "FileStream.hpp"

// State of one pass over the whole file. Workers share it; tokens and error
// are guarded by mutex.
struct UploadAttempt {
	std::string session_id;

	std::atomic<size_t> next_part{ 0 };
	std::atomic<bool> cancelled{ false };

	std::mutex mutex;
	std::map<uint32_t, std::string> tokens;
	std::optional<UploadError> error;

	void Fail(UploadError err)
	{
		std::lock_guard<std::mutex> lock(mutex);
		if (!error)
			error = std::move(err);
		cancelled.store(true);
	}
};

namespace {
	UploadError FromClientError(const StorageClient::Error& err, const std::string& what)
	{
		return MakeTransferError(err.code, fmt::format("{}: {}", what, err.message));
	}

	UploadError FromStreamError(const FileStream::Error& err)
	{
		return MakeTransferError(err.code, fmt::format("failed to read source: {}", err.message));
	}

	uint64_t TotalBytes(const UploadPlan& plan) noexcept
	{
		uint64_t total = 0;
		for (const Part& part : plan)
			total += part.length;
		return total;
	}
}

UploadOrchestrator::UploadOrchestrator(StorageClient& client, Options options,
				       std::shared_ptr<spdlog::logger> logger, Sleeper sleeper)
	: client_(client)
	, options_(std::move(options))
	, logger_(logger ? std::move(logger) : spdlog::default_logger())
	, sleeper_(std::move(sleeper))
{
}

UploadOrchestrator::Sleeper UploadOrchestrator::DefaultSleeper()
{
	return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

const char* UploadOrchestrator::StateName(State state) noexcept
{
	switch (state) {
	case State::Idle:          return "idle";
	case State::SessionOpen:   return "session-open";
	case State::PartsInFlight: return "parts-in-flight";
	case State::Completing:    return "completing";
	case State::Aborting:      return "aborting";
	case State::Done:          return "done";
	case State::Failed:        return "failed";
	}

	return "unknown";
}

UploadOrchestrator::State UploadOrchestrator::GetState() const noexcept
{
	return state_.load();
}

unsigned int UploadOrchestrator::GetAttemptCount() const noexcept
{
	return attempts_.load();
}

void UploadOrchestrator::SetState(State state) noexcept
{
	const State previous = state_.exchange(state);
	logger_->debug("upload state: {} -> {}", StateName(previous), StateName(state));
}

std::optional<UploadError> UploadOrchestrator::Upload(const std::filesystem::path& source,
						      const DestinationTarget& target,
						      const UploadPlan& plan,
						      ProgressSink* progress)
{
	if (options_.parallelism == 0)
		return MakeConfigurationError("Number of parallel transfers must be at least 1");

	if (options_.max_attempts == 0)
		return MakeConfigurationError("Maximum upload attempts must be at least 1");

	if (plan.empty())
		return MakeConfigurationError("Upload plan has no parts");

	const uint64_t total = TotalBytes(plan);
	std::chrono::milliseconds delay = options_.retry_delay;
	std::optional<UploadError> last_error;

	state_.store(State::Idle);
	attempts_.store(0);

	for (unsigned int attempt = 1; attempt <= options_.max_attempts; attempt++) {
		attempts_.store(attempt);

		if (progress)
			progress->Reset();

		auto err = RunAttempt(source, target, plan, total, progress);
		if (!err) {
			SetState(State::Done);
			return std::nullopt;
		}

		logger_->error("Error during upload (attempt {}/{}): {}", attempt, options_.max_attempts, err->message);
		last_error = std::move(err);

		if (attempt == options_.max_attempts)
			break;

		logger_->warn("Sleeping for {} before next attempt", delay);
		sleeper_(delay);
		delay *= 2;
	}

	SetState(State::Failed);
	logger_->error("Maximum upload attempts exceeded!");

	if (last_error)
		return last_error;

	return MakeTransferError(-1, "Upload and retries failed, but without raising an error");
}

std::optional<UploadError> UploadOrchestrator::RunAttempt(const std::filesystem::path& source,
							  const DestinationTarget& target,
							  const UploadPlan& plan, uint64_t total,
							  ProgressSink* progress)
{
	if (total < options_.multipart_threshold)
		return RunDirect(source, target, total, progress);

	return RunMultipart(source, target, plan, progress);
}

std::optional<UploadError> UploadOrchestrator::RunDirect(const std::filesystem::path& source,
							 const DestinationTarget& target,
							 uint64_t total, ProgressSink* progress)
{
	SetState(State::PartsInFlight);

	FileStream stream(source);
	if (auto err = stream.Open(std::ios::binary | std::ios::in)) {
		SetState(State::Idle);
		return FromStreamError(*err);
	}

	std::string data;
	auto read_err = stream.ReadRange(0, total, data);
	if (auto close_err = stream.Close())
		logger_->debug("failed to close {}: {}", source.string(), close_err->message);

	if (read_err) {
		SetState(State::Idle);
		return FromStreamError(*read_err);
	}

	logger_->debug("putting {} bytes to {}/{}", total, target.container, target.key);

	if (auto err = client_.PutObjectDirect(target.container, target.key, data)) {
		SetState(State::Idle);
		return FromClientError(*err, "failed to put object");
	}

	if (progress)
		progress->BytesCompleted(total);

	return std::nullopt;
}

std::optional<UploadError> UploadOrchestrator::RunMultipart(const std::filesystem::path& source,
							    const DestinationTarget& target,
							    const UploadPlan& plan, ProgressSink* progress)
{
	UploadAttempt attempt;

	auto [ok, session_id, err] = client_.CreateMultipartSession(target.container, target.key);
	if (!ok) {
		SetState(State::Idle);
		return FromClientError(err, "failed to create multipart upload");
	}

	attempt.session_id = std::move(session_id);
	SetState(State::SessionOpen);
	logger_->debug("multipart upload {} opened for {}/{} ({} parts)",
		       attempt.session_id, target.container, target.key, plan.size());

	const size_t workers = std::min<size_t>(options_.parallelism, plan.size());

	SetState(State::PartsInFlight);
	{
		std::vector<std::thread> pool;
		pool.reserve(workers);

		try {
			for (size_t i = 0; i < workers; i++)
				pool.emplace_back(&UploadOrchestrator::RunWorker, this,
						  std::ref(attempt), std::cref(source), std::cref(plan), progress);
		}
		catch (const std::system_error& e) {
			attempt.Fail(MakeTransferError(e.code().value(), fmt::format("failed to start worker: {}", e.what())));
		}

		for (auto& worker : pool)
			worker.join();
	}

	if (!attempt.error)
		if (auto complete_err = Complete(attempt, plan))
			attempt.error = std::move(complete_err);

	if (attempt.error) {
		Abort(attempt);
		SetState(State::Idle);
		return attempt.error;
	}

	return std::nullopt;
}

void UploadOrchestrator::RunWorker(UploadAttempt& attempt, const std::filesystem::path& source,
				   const UploadPlan& plan, ProgressSink* progress) noexcept
{
	try {
		FileStream stream(source);
		if (auto err = stream.Open(std::ios::binary | std::ios::in)) {
			attempt.Fail(FromStreamError(*err));
			return;
		}

		std::string buffer;
		while (!attempt.cancelled.load()) {
			const size_t i = attempt.next_part.fetch_add(1);
			if (i >= plan.size())
				break;

			const Part& part = plan[i];
			if (auto err = stream.ReadRange(part.offset, part.length, buffer)) {
				attempt.Fail(FromStreamError(*err));
				break;
			}

			// Another worker may have failed while this part was being read.
			if (attempt.cancelled.load())
				break;

			logger_->debug("uploading part {} ({} bytes at offset {})", part.index, part.length, part.offset);

			auto [ok, token, err] = client_.UploadPart(attempt.session_id, part.index, buffer);
			if (!ok) {
				attempt.Fail(FromClientError(err, fmt::format("failed to upload part {}", part.index)));
				break;
			}

			{
				std::lock_guard<std::mutex> lock(attempt.mutex);
				attempt.tokens[part.index] = std::move(token);
			}

			if (progress)
				progress->BytesCompleted(part.length);
		}

		if (auto err = stream.Close())
			logger_->debug("failed to close {}: {}", source.string(), err->message);
	}
	catch (const std::exception& e) {
		attempt.Fail(MakeTransferError(-1, fmt::format("part upload failed: {}", e.what())));
	}
}

std::optional<UploadError> UploadOrchestrator::Complete(UploadAttempt& attempt, const UploadPlan& plan)
{
	SetState(State::Completing);

	if (attempt.tokens.size() != plan.size())
		return MakeTransferError(-1, fmt::format("{} of {} parts uploaded", attempt.tokens.size(), plan.size()));

	// std::map keeps the parts in index order whatever order they finished in.
	std::vector<StorageClient::CompletedPart> parts;
	parts.reserve(attempt.tokens.size());
	for (const auto& [index, token] : attempt.tokens)
		parts.push_back(StorageClient::CompletedPart{ index, token });

	if (auto err = client_.CompleteMultipartSession(attempt.session_id, parts))
		return FromClientError(*err, "failed to complete multipart upload");

	logger_->debug("multipart upload {} completed", attempt.session_id);

	return std::nullopt;
}

void UploadOrchestrator::Abort(const UploadAttempt& attempt)
{
	SetState(State::Aborting);

	if (auto err = client_.AbortMultipartSession(attempt.session_id)) {
		const UploadError abort_error{ UploadError::Kind::Abort, err->code, err->message };
		logger_->warn("failed to abort multipart upload {} ({} error): {}",
			      attempt.session_id, UploadErrorKindName(abort_error.kind), abort_error.message);
		return;
	}

	logger_->debug("multipart upload {} aborted", attempt.session_id);
}
