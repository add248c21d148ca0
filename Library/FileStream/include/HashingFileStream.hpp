#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "FileStream.hpp"
#include "Hasher.hpp"

// Output file that digests everything written to it. The digest is
// available once the stream has been closed.
class HashingFileStream final
{
public:
    using Error = FileStream::Error;

public:
    HashingFileStream(const std::filesystem::path& path, Hasher::Type type);

public:
    std::optional<Error> Open(std::ios::openmode mode) noexcept;
    std::optional<Error> Write(std::string_view data) noexcept;
    std::optional<Error> Close() noexcept;

public:
    uint64_t GetBytesWritten() const noexcept;
    std::optional<std::vector<uint8_t>> GetHash() const noexcept;
    std::optional<std::string> GetHashHex() const;

private:
    static Error ConvertHasherError(const Hasher::Error& e);

private:
    FileStream file_;
    Hasher hasher_;
    uint64_t written_ = 0;
    std::optional<std::vector<uint8_t>> digest_;
};
