#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "UploadError.hpp"

class SizeParser
{
public:
	// Converts "50 MiB", "50MB" or a bare "50" into a byte count. A bare
	// number is read as default_unit * default_multiplier * count.
	static std::tuple<bool, uint64_t, UploadError> Parse(
		std::string_view expression,
		std::string_view default_unit = "byte",
		std::string_view default_multiplier = "MiB");

	// Accepted unit names, sorted.
	static std::vector<std::string> UnitNames();
};
