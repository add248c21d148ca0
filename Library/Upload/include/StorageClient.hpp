#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

// Object storage operations needed to upload one object, either in a single
// request or as a multipart session. Implementations must allow UploadPart to
// be called from several threads at once.
class StorageClient
{
public:
	struct Error {
		int code = 0;
		std::string message;
	};

	struct CompletedPart {
		uint32_t index;
		std::string token;
	};

public:
	virtual ~StorageClient() = default;

public:
	virtual std::tuple<bool, bool, Error> ContainerExists(const std::string& container) = 0;

	// A missing object is reported as (true, false), not as an error.
	virtual std::tuple<bool, bool, Error> ObjectExists(const std::string& container, const std::string& key) = 0;

	virtual std::tuple<bool, std::string, Error> CreateMultipartSession(const std::string& container, const std::string& key) = 0;

	// Returns the completion token of the part.
	virtual std::tuple<bool, std::string, Error> UploadPart(const std::string& session_id, uint32_t index, std::string_view data) = 0;

	// parts must be sorted by index.
	virtual std::optional<Error> CompleteMultipartSession(const std::string& session_id, const std::vector<CompletedPart>& parts) = 0;

	virtual std::optional<Error> AbortMultipartSession(const std::string& session_id) = 0;

	virtual std::optional<Error> PutObjectDirect(const std::string& container, const std::string& key, std::string_view data) = 0;
};
