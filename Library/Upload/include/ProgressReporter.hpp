#pragma once

#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

// Receives the size of every part once it has been transferred.
class ProgressSink
{
public:
	virtual ~ProgressSink() = default;

public:
	virtual void BytesCompleted(uint64_t bytes) = 0;
	virtual void Reset() = 0;
};

// Keeps a byte counter and rewrites a single status line on every update:
//   <name>  <seen> / <total>  (<pct>%)
class ProgressReporter final : public ProgressSink
{
public:
	ProgressReporter(std::string name, uint64_t total_bytes, std::ostream& out);

public:
	void BytesCompleted(uint64_t bytes) override;
	void Reset() override;

	std::string Render() const;
	uint64_t GetBytesSeen() const;

	// Ends the status line.
	void Finish();

private:
	std::string RenderLocked() const;

private:
	const std::string name_;
	const uint64_t total_bytes_;

	mutable std::mutex mutex_;
	uint64_t bytes_seen_ = 0;
	std::ostream& out_;
};
