#pragma once

#include <utility/describe.hpp>
#include <utility/enum_string_convert.hpp>
#include <utility/algorithm/case_convert.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

namespace Utility::Test
{
    BOOST_DEFINE_ENUM_CLASS(Fruit, Apple, Banana, Cherry)

    class EnumStringConvertTests : public ::testing::Test
    {};

    TEST_F(EnumStringConvertTests, EnumeratorNamesAreUsed)
    {
        EXPECT_EQ(enumToString(Fruit::Apple), "Apple");
        EXPECT_EQ(enumToString(Fruit::Cherry), "Cherry");
    }

    TEST_F(EnumStringConvertTests, NamesAreParsedBack)
    {
        EXPECT_EQ(enumFromString<Fruit>("Banana"), Fruit::Banana);
        ASSERT_TRUE(tryEnumFromString<Fruit>("Cherry").has_value());
        EXPECT_EQ(*tryEnumFromString<Fruit>("Cherry"), Fruit::Cherry);
    }

    TEST_F(EnumStringConvertTests, UnknownNameIsRejected)
    {
        EXPECT_FALSE(tryEnumFromString<Fruit>("Durian").has_value());
        EXPECT_THROW(enumFromString<Fruit>("apple"), std::invalid_argument);
    }

    TEST_F(EnumStringConvertTests, LowerCaseConversionLeavesOtherCharactersAlone)
    {
        EXPECT_EQ(Algorithm::toLowerCase("WaRnInG-42"), "warning-42");
    }
}
