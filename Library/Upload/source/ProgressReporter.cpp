#include "ProgressReporter.hpp"

#include "fmt/core.h"

ProgressReporter::ProgressReporter(std::string name, uint64_t total_bytes, std::ostream& out)
    : name_(std::move(name))
    , total_bytes_(total_bytes)
    , out_(out)
{
}

void ProgressReporter::BytesCompleted(uint64_t bytes)
{
    std::lock_guard<std::mutex> lock(mutex_);

    bytes_seen_ += bytes;
    out_ << '\r' << RenderLocked() << std::flush;
}

void ProgressReporter::Reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    bytes_seen_ = 0;
}

std::string ProgressReporter::Render() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return RenderLocked();
}

uint64_t ProgressReporter::GetBytesSeen() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_seen_;
}

void ProgressReporter::Finish()
{
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "\r\n" << std::flush;
}

std::string ProgressReporter::RenderLocked() const
{
    const double percentage = total_bytes_ == 0
        ? 100.0
        : static_cast<double>(bytes_seen_) / static_cast<double>(total_bytes_) * 100.0;

    return fmt::format("{}  {} / {}  ({:.2f}%)", name_, bytes_seen_, total_bytes_, percentage);
}
