#include <gtest/gtest.h>

#include "PartPlanner.hpp"

namespace {
    constexpr uint64_t MiB = 1024 * 1024;

    const PartPlanner::Limits kNoLimits{ 0, 10000 };

    UploadPlan PlanOk(uint64_t file_size, uint64_t part_size, const PartPlanner::Limits& limits = kNoLimits)
    {
        auto [ok, plan, err] = PartPlanner::Plan(file_size, part_size, limits);
        EXPECT_TRUE(ok) << err.message;
        return plan;
    }

    void ExpectCoversFile(const UploadPlan& plan, uint64_t file_size, uint64_t part_size)
    {
        ASSERT_FALSE(plan.empty());

        const uint64_t expected_count = file_size == 0 ? 1 : (file_size + part_size - 1) / part_size;
        EXPECT_EQ(plan.size(), expected_count);

        uint64_t offset = 0;
        for (size_t i = 0; i < plan.size(); i++) {
            EXPECT_EQ(plan[i].index, i + 1);
            EXPECT_EQ(plan[i].offset, offset);
            if (i + 1 < plan.size())
                EXPECT_EQ(plan[i].length, part_size);
            else
                EXPECT_LE(plan[i].length, part_size);
            offset += plan[i].length;
        }

        EXPECT_EQ(offset, file_size);
    }
}

TEST(PartPlannerTest, LastPartHoldsTheRemainder)
{
    const UploadPlan plan = PlanOk(120 * MiB, 50 * MiB);

    ASSERT_EQ(plan.size(), 3U);
    EXPECT_EQ(plan[0].length, 50 * MiB);
    EXPECT_EQ(plan[1].length, 50 * MiB);
    EXPECT_EQ(plan[2].length, 20 * MiB);
    EXPECT_EQ(plan[2].offset, 100 * MiB);
}

TEST(PartPlannerTest, ExactMultipleHasNoShortPart)
{
    const UploadPlan plan = PlanOk(100 * MiB, 50 * MiB);

    ASSERT_EQ(plan.size(), 2U);
    EXPECT_EQ(plan[1].length, 50 * MiB);
}

TEST(PartPlannerTest, EmptyFileIsOneEmptyPart)
{
    const UploadPlan plan = PlanOk(0, 50 * MiB);

    ASSERT_EQ(plan.size(), 1U);
    EXPECT_EQ(plan[0].index, 1U);
    EXPECT_EQ(plan[0].offset, 0U);
    EXPECT_EQ(plan[0].length, 0U);
}

TEST(PartPlannerTest, PartsCoverTheFile)
{
    for (uint64_t file_size : { 1ULL, 49ULL, 50ULL, 51ULL, 99ULL, 100ULL, 101ULL, 12345ULL })
        for (uint64_t part_size : { 1ULL, 7ULL, 50ULL, 1000ULL })
            ExpectCoversFile(PlanOk(file_size, part_size), file_size, part_size);
}

TEST(PartPlannerTest, SamePlanForSameInputs)
{
    const UploadPlan a = PlanOk(12345, 100);
    const UploadPlan b = PlanOk(12345, 100);

    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); i++) {
        EXPECT_EQ(a[i].offset, b[i].offset);
        EXPECT_EQ(a[i].length, b[i].length);
    }
}

TEST(PartPlannerTest, RejectsZeroPartSize)
{
    auto [ok, plan, err] = PartPlanner::Plan(100, 0, kNoLimits);
    EXPECT_FALSE(ok);
    EXPECT_EQ(err.kind, UploadError::Kind::Configuration);
}

TEST(PartPlannerTest, RejectsPartSizeBelowServiceMinimum)
{
    const PartPlanner::Limits limits{ 5 * MiB, 10000 };

    auto [ok, plan, err] = PartPlanner::Plan(100 * MiB, 1 * MiB, limits);
    EXPECT_FALSE(ok);
    EXPECT_EQ(err.kind, UploadError::Kind::Configuration);

    EXPECT_EQ(PlanOk(100 * MiB, 5 * MiB, limits).size(), 20U);
}

TEST(PartPlannerTest, SinglePartIgnoresServiceMinimum)
{
    const PartPlanner::Limits limits{ 5 * MiB, 10000 };

    const UploadPlan plan = PlanOk(3 * MiB, 4 * MiB, limits);
    ASSERT_EQ(plan.size(), 1U);
    EXPECT_EQ(plan[0].index, 1U);
    EXPECT_EQ(plan[0].offset, 0U);
    EXPECT_EQ(plan[0].length, 3 * MiB);

    EXPECT_EQ(PlanOk(0, 1 * MiB, limits).size(), 1U);
}

TEST(PartPlannerTest, RejectsTooManyParts)
{
    const PartPlanner::Limits limits{ 0, 4 };

    auto [ok, plan, err] = PartPlanner::Plan(100, 20, limits);
    EXPECT_FALSE(ok);
    EXPECT_EQ(err.kind, UploadError::Kind::Configuration);
    EXPECT_NE(err.message.find("at least 25 bytes"), std::string::npos) << err.message;

    EXPECT_EQ(PlanOk(100, 25, limits).size(), 4U);
}

TEST(PartPlannerTest, WholeFileIsOnePart)
{
    const UploadPlan plan = PartPlanner::Whole(1234);

    ASSERT_EQ(plan.size(), 1U);
    EXPECT_EQ(plan[0].index, 1U);
    EXPECT_EQ(plan[0].offset, 0U);
    EXPECT_EQ(plan[0].length, 1234U);
}
