#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "DestinationResolver.hpp"
#include "PartPlanner.hpp"
#include "ProgressReporter.hpp"
#include "StorageClient.hpp"
#include "UploadError.hpp"

struct UploadAttempt;

// Uploads one file, either with a single put or as a multipart session whose
// parts are sent by a bounded pool of worker threads. A failed attempt is
// aborted and the whole file is sent again from a new session, waiting
// retry_delay before the next attempt and doubling the wait every time.
//
//   Idle -> SessionOpen -> PartsInFlight -> Completing -> Done
//                          PartsInFlight -> Aborting -> Idle (retry) | Failed
class UploadOrchestrator
{
public:
	enum class State {
		Idle,
		SessionOpen,
		PartsInFlight,
		Completing,
		Aborting,
		Done,
		Failed
	};

	struct Options {
		unsigned int parallelism = 2;
		unsigned int max_attempts = 10;
		std::chrono::milliseconds retry_delay = std::chrono::seconds(10);

		// Smaller files are sent with PutObjectDirect.
		uint64_t multipart_threshold = 50ULL * 1024 * 1024;
	};

	using Sleeper = std::function<void(std::chrono::milliseconds)>;

public:
	UploadOrchestrator(StorageClient& client, Options options,
			   std::shared_ptr<spdlog::logger> logger,
			   Sleeper sleeper = DefaultSleeper());

public:
	// progress may be null. Returns the last transfer error once every
	// attempt has failed.
	std::optional<UploadError> Upload(const std::filesystem::path& source,
					  const DestinationTarget& target,
					  const UploadPlan& plan,
					  ProgressSink* progress = nullptr);

	State GetState() const noexcept;
	unsigned int GetAttemptCount() const noexcept;

	static Sleeper DefaultSleeper();
	static const char* StateName(State state) noexcept;

private:
	std::optional<UploadError> RunAttempt(const std::filesystem::path& source, const DestinationTarget& target,
					      const UploadPlan& plan, uint64_t total, ProgressSink* progress);
	std::optional<UploadError> RunDirect(const std::filesystem::path& source, const DestinationTarget& target,
					     uint64_t total, ProgressSink* progress);
	std::optional<UploadError> RunMultipart(const std::filesystem::path& source, const DestinationTarget& target,
						const UploadPlan& plan, ProgressSink* progress);

	void RunWorker(UploadAttempt& attempt, const std::filesystem::path& source,
		       const UploadPlan& plan, ProgressSink* progress) noexcept;
	std::optional<UploadError> Complete(UploadAttempt& attempt, const UploadPlan& plan);
	void Abort(const UploadAttempt& attempt);

	void SetState(State state) noexcept;

private:
	StorageClient& client_;
	const Options options_;
	std::shared_ptr<spdlog::logger> logger_;
	Sleeper sleeper_;

	std::atomic<State> state_{ State::Idle };
	std::atomic<unsigned int> attempts_{ 0 };
};
