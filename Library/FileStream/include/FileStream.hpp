#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

class FileStream {
public:
	struct Error {
		int code = 0;
		std::string message;
	};

public:
	explicit FileStream(const std::filesystem::path& path);

public:
	std::tuple<bool, uint64_t, Error> GetSize() const noexcept;

public:
	std::optional<Error> Open(std::ios::openmode mode) noexcept;
	std::optional<Error> Write(std::string_view data) noexcept;

	std::tuple<bool, std::streamsize, Error> Read(char* data, std::streamsize size) noexcept;

	// Reads exactly length bytes starting at offset; a short read is an error.
	std::optional<Error> ReadRange(uint64_t offset, uint64_t length, std::string& out) noexcept;

	std::optional<Error> Seek(uint64_t offset) noexcept;

	std::optional<Error> Close() noexcept;

private:
	Error stream_error(const std::ios& stream, const char* context) const noexcept;

private:
	const std::filesystem::path path_;
	std::fstream stream_;
};
