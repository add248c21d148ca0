#pragma once

#include <cstdint>
#include <tuple>
#include <vector>

#include "UploadError.hpp"

struct Part {
	uint32_t index;   // 1-based
	uint64_t offset;
	uint64_t length;
};

using UploadPlan = std::vector<Part>;

class PartPlanner
{
public:
	struct Limits {
		uint64_t min_part_size = 0;
		uint32_t max_part_count = 10000;
	};

public:
	// Cuts file_size bytes into parts of part_size bytes, the last part
	// taking the remainder. An empty file yields one empty part.
	static std::tuple<bool, UploadPlan, UploadError> Plan(uint64_t file_size, uint64_t part_size, const Limits& limits);

	// The whole file as a single part, for direct uploads.
	static UploadPlan Whole(uint64_t file_size);
};
