#pragma once

#include <shared_data/file_operations/operation_progress.hpp>

#include <gtest/gtest.h>

#include <chrono>

using namespace std::chrono_literals;

namespace SharedData::Test
{
    class OperationProgressTests : public ::testing::Test
    {};

    TEST_F(OperationProgressTests, EmptyOperationIsComplete)
    {
        OperationProgress progress;
        EXPECT_DOUBLE_EQ(progress.percentage(), 100.0);
    }

    TEST_F(OperationProgressTests, PercentageFollowsBytesWhenKnown)
    {
        OperationProgress progress{.totalBytes = 1000, .transferredBytes = 250, .totalFiles = 4, .completedFiles = 3};
        EXPECT_DOUBLE_EQ(progress.percentage(), 25.0);
    }

    TEST_F(OperationProgressTests, PercentageFallsBackToFileCount)
    {
        OperationProgress progress{.totalFiles = 4, .completedFiles = 1};
        EXPECT_DOUBLE_EQ(progress.percentage(), 25.0);
    }

    TEST_F(OperationProgressTests, PercentageNeverExceedsHundred)
    {
        OperationProgress progress{.totalBytes = 100, .transferredBytes = 400};
        EXPECT_DOUBLE_EQ(progress.percentage(), 100.0);

        OperationProgress files{.totalFiles = 2, .completedFiles = 7};
        EXPECT_DOUBLE_EQ(files.percentage(), 100.0);
    }

    TEST_F(OperationProgressTests, NothingDoneIsZeroPercent)
    {
        OperationProgress progress{.totalBytes = 100};
        EXPECT_DOUBLE_EQ(progress.percentage(), 0.0);
    }

    TEST_F(OperationProgressTests, UpdateSpeedComputesRateAndRemainingTime)
    {
        OperationProgress progress{.totalBytes = 1000, .transferredBytes = 500};
        progress.updateSpeed(500, 2s);
        EXPECT_EQ(progress.speedBytesPerSecond, 250u);
        EXPECT_EQ(progress.estimatedRemaining, 2s);
    }

    TEST_F(OperationProgressTests, UpdateSpeedIgnoresZeroElapsedTime)
    {
        OperationProgress progress{.totalBytes = 1000, .transferredBytes = 500, .speedBytesPerSecond = 7};
        progress.updateSpeed(500, 0s);
        EXPECT_EQ(progress.speedBytesPerSecond, 7u);
        EXPECT_EQ(progress.estimatedRemaining, 0s);
    }

    TEST_F(OperationProgressTests, JsonContainsPercentageAndOptionalCurrentFile)
    {
        OperationProgress progress{.totalBytes = 200, .transferredBytes = 50};
        nlohmann::json j = progress;
        EXPECT_DOUBLE_EQ(j["percentage"].get<double>(), 25.0);
        EXPECT_FALSE(j.contains("currentFile"));

        progress.currentFile = "a.txt";
        j = progress;
        EXPECT_EQ(j["currentFile"], "a.txt");
    }
}
