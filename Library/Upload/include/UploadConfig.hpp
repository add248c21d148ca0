#pragma once

#include <chrono>
#include <cstdint>
#include <string>

struct UploadConfig {
	// Number of parts transferred at the same time.
	unsigned int parallelism = 2;

	// Total upload attempts, including the first one.
	unsigned int max_attempts = 10;

	// Size of every part but the last one.
	std::string part_size = "50 MiB";

	// Files at or above this size are sent as multipart uploads.
	std::string multipart_threshold = "50 MiB";

	// Smallest part (all but the last) the storage service accepts.
	uint64_t min_part_size = 5ULL * 1024 * 1024;

	// Largest number of parts the storage service accepts in one session.
	uint32_t max_part_count = 10000;

	// Wait before the second attempt; doubled after every failure.
	std::chrono::milliseconds retry_delay = std::chrono::seconds(10);

	bool force = false;
	bool verbose = false;
	bool quiet = false;

	// Accepted for command line compatibility, no effect.
	bool reduced_redundancy = false;
	bool insecure = false;
};
