#pragma once

#include <string>
#include <string_view>
#include <tuple>

#include "UploadError.hpp"

struct DestinationTarget {
	std::string container;
	std::string key;
};

class DestinationResolver
{
public:
	static constexpr std::string_view kScheme = "s3";

public:
	// Splits "s3://container/path" into the container and the object key.
	// A path that is empty, "/" or ends with "/" names a directory, and the
	// source base name is appended to it.
	static std::tuple<bool, DestinationTarget, UploadError> Resolve(
		std::string_view destination, std::string_view source_basename);
};
