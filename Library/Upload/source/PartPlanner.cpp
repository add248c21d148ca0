#include "PartPlanner.hpp"

#include <algorithm>

#include "fmt/core.h"

std::tuple<bool, UploadPlan, UploadError> PartPlanner::Plan(uint64_t file_size, uint64_t part_size, const Limits& limits)
{
    if (part_size == 0)
        return { false, UploadPlan{}, MakeConfigurationError("Part size must be greater than zero") };

    if (limits.max_part_count == 0)
        return { false, UploadPlan{}, MakeConfigurationError("Part count limit must be greater than zero") };

    const uint64_t count = file_size == 0 ? 1 : file_size / part_size + (file_size % part_size ? 1 : 0);

    // The last part may be smaller than the minimum, so a single part always fits.
    if (count > 1 && part_size < limits.min_part_size)
        return { false, UploadPlan{}, MakeConfigurationError(
            fmt::format("Part size {} is below the minimum of {} bytes", part_size, limits.min_part_size)) };

    if (count > limits.max_part_count) {
        const uint64_t smallest = file_size / limits.max_part_count + (file_size % limits.max_part_count ? 1 : 0);
        return { false, UploadPlan{}, MakeConfigurationError(
            fmt::format("{} parts needed but at most {} are allowed; use a part size of at least {} bytes",
                        count, limits.max_part_count, smallest)) };
    }

    UploadPlan plan;
    plan.reserve(static_cast<size_t>(count));

    uint64_t offset = 0;
    for (uint64_t i = 0; i < count; i++) {
        const uint64_t length = std::min(part_size, file_size - offset);
        plan.push_back(Part{ static_cast<uint32_t>(i + 1), offset, length });
        offset += length;
    }

    return { true, std::move(plan), UploadError{} };
}

UploadPlan PartPlanner::Whole(uint64_t file_size)
{
    return UploadPlan{ Part{ 1, 0, file_size } };
}
