#pragma once

#include <utility/format_bytes.hpp>

#include <gtest/gtest.h>

namespace Utility::Test
{
    class FormatBytesTests : public ::testing::Test
    {};

    TEST_F(FormatBytesTests, SmallValuesAreShownInBytes)
    {
        EXPECT_EQ(formatBytes(0), "0 B");
        EXPECT_EQ(formatBytes(1023), "1023 B");
    }

    TEST_F(FormatBytesTests, LargerValuesUseBinaryUnits)
    {
        EXPECT_EQ(formatBytes(1024), "1.00 KB");
        EXPECT_EQ(formatBytes(1536), "1.50 KB");
        EXPECT_EQ(formatBytes(5ull * 1024 * 1024), "5.00 MB");
        EXPECT_EQ(formatBytes(3ull * 1024 * 1024 * 1024), "3.00 GB");
    }

    TEST_F(FormatBytesTests, MagnitudeCanBeForced)
    {
        EXPECT_EQ(formatBytes(512, OrderOfMagnitude::Kilo), "0.50 KB");
    }
}
