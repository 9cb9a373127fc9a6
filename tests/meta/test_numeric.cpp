#include <gtest/gtest.h>

#include "enumkit/meta/numeric.hpp"

#include <cstdint>
#include <limits>
#include <string>

using namespace enumkit::meta;

TEST(NumericOpsTest, BitOperationsStayInWidth) {
    using Ops = NumericOps<std::int8_t>;
    EXPECT_EQ(Ops::bitNot(0), -1);
    EXPECT_EQ(Ops::bitOr(1, -128), -127);
    EXPECT_EQ(Ops::bitAnd(-1, 0x0F), 0x0F);
    EXPECT_EQ(Ops::bitXor(0x0F, -1), static_cast<std::int8_t>(0xF0));
    EXPECT_EQ(NumericOps<std::uint8_t>::bitNot(0x0F), 0xF0);
}

TEST(NumericOpsTest, PopCountAndSingleBit) {
    using Ops = NumericOps<std::int16_t>;
    EXPECT_EQ(Ops::popCount(0), 0);
    EXPECT_EQ(Ops::popCount(-1), 16);
    EXPECT_TRUE(Ops::hasSingleBit(std::numeric_limits<std::int16_t>::min()));
    EXPECT_TRUE(Ops::hasSingleBit(64));
    EXPECT_FALSE(Ops::hasSingleBit(0));
    EXPECT_FALSE(Ops::hasSingleBit(65));
    EXPECT_TRUE(Ops::isPowerOfTwoOrZero(0));
}

TEST(NumericOpsTest, LowestBit) {
    EXPECT_EQ(NumericOps<std::int32_t>::lowestBit(0b101000), 0b1000);
    EXPECT_EQ(NumericOps<std::int32_t>::lowestBit(0), 0);
    EXPECT_EQ(NumericOps<std::uint64_t>::lowestBit(1ULL << 63), 1ULL << 63);
}

TEST(NumericOpsTest, AddOneWraps) {
    EXPECT_EQ(NumericOps<std::uint8_t>::addOne(255), 0);
    EXPECT_EQ(NumericOps<std::int8_t>::addOne(127), -128);
}

TEST(NumericOpsTest, ValueRange) {
    using Ops = NumericOps<std::int8_t>;
    EXPECT_TRUE(Ops::isInValueRange(std::int64_t{-128}));
    EXPECT_FALSE(Ops::isInValueRange(std::int64_t{128}));
    EXPECT_FALSE(Ops::isInValueRange(std::uint64_t{200}));
    EXPECT_FALSE(NumericOps<std::uint32_t>::isInValueRange(std::int64_t{-1}));
    EXPECT_TRUE(NumericOps<std::uint64_t>::isInValueRange(
        std::numeric_limits<std::uint64_t>::max()));
}

TEST(NumericOpsTest, ParseDecimal) {
    using Ops = NumericOps<std::int8_t>;
    auto result = Ops::parseDecimal("-128");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value, -128);

    result = Ops::parseDecimal("+127");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value, 127);

    EXPECT_EQ(Ops::parseDecimal("-0").value, 0);
    EXPECT_TRUE(Ops::parseDecimal("-0").ok());
}

TEST(NumericOpsTest, ParseDecimalOverflow) {
    EXPECT_EQ(NumericOps<std::int8_t>::parseDecimal("128").status,
              NumericParseStatus::Overflow);
    EXPECT_EQ(NumericOps<std::int8_t>::parseDecimal("-129").status,
              NumericParseStatus::Overflow);
    EXPECT_EQ(NumericOps<std::uint8_t>::parseDecimal("-1").status,
              NumericParseStatus::Overflow);
    EXPECT_EQ(NumericOps<std::uint64_t>::parseDecimal("18446744073709551616")
                  .status,
              NumericParseStatus::Overflow);
}

TEST(NumericOpsTest, ParseDecimalInvalid) {
    using Ops = NumericOps<std::int32_t>;
    EXPECT_EQ(Ops::parseDecimal("").status, NumericParseStatus::Invalid);
    EXPECT_EQ(Ops::parseDecimal("-").status, NumericParseStatus::Invalid);
    EXPECT_EQ(Ops::parseDecimal("12a").status, NumericParseStatus::Invalid);
    EXPECT_EQ(Ops::parseDecimal("+-3").status, NumericParseStatus::Invalid);
    EXPECT_EQ(Ops::parseDecimal("Monday").status, NumericParseStatus::Invalid);
}

TEST(NumericOpsTest, ParseHex) {
    auto result = NumericOps<std::int8_t>::parseHex("FF");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value, -1);

    result = NumericOps<std::int8_t>::parseHex("0x7f");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value, 127);

    EXPECT_EQ(NumericOps<std::int8_t>::parseHex("100").status,
              NumericParseStatus::Overflow);
    EXPECT_EQ(NumericOps<std::int8_t>::parseHex("-1").status,
              NumericParseStatus::Invalid);
    EXPECT_EQ(NumericOps<std::int8_t>::parseHex("0x").status,
              NumericParseStatus::Invalid);
}

TEST(NumericOpsTest, ToString) {
    EXPECT_EQ(NumericOps<std::int8_t>::toDecimalString(-5), "-5");
    EXPECT_EQ(NumericOps<std::uint8_t>::toDecimalString(200), "200");
    EXPECT_EQ(NumericOps<std::int8_t>::toHexString(-1), "FF");
    EXPECT_EQ(NumericOps<std::int32_t>::toHexString(10), "0000000A");
    EXPECT_EQ(NumericOps<std::uint64_t>::toHexString(1ULL << 63),
              "8000000000000000");
}

template <typename T>
class NumericWidthTest : public ::testing::Test {};

using UnderlyingTypes =
    ::testing::Types<std::int8_t, std::uint8_t, std::int16_t, std::uint16_t,
                     std::int32_t, std::uint32_t, std::int64_t, std::uint64_t>;
TYPED_TEST_SUITE(NumericWidthTest, UnderlyingTypes);

TYPED_TEST(NumericWidthTest, ExtremesRoundTripThroughText) {
    using Ops = NumericOps<TypeParam>;
    constexpr auto kMin = std::numeric_limits<TypeParam>::min();
    constexpr auto kMax = std::numeric_limits<TypeParam>::max();

    auto min = Ops::parseDecimal(Ops::toDecimalString(kMin));
    ASSERT_TRUE(min.ok());
    EXPECT_EQ(min.value, kMin);
    auto max = Ops::parseHex(Ops::toHexString(kMax));
    ASSERT_TRUE(max.ok());
    EXPECT_EQ(max.value, kMax);
    EXPECT_EQ(Ops::toHexString(kMax).size(),
              static_cast<std::size_t>(Ops::hex_digits));
}

TYPED_TEST(NumericWidthTest, AllBitsSet) {
    using Ops = NumericOps<TypeParam>;
    const auto all = Ops::bitNot(Ops::zero);
    EXPECT_EQ(Ops::popCount(all), Ops::bit_width);
    EXPECT_EQ(Ops::bitAnd(all, Ops::one), Ops::one);
    EXPECT_EQ(Ops::bitXor(all, all), Ops::zero);
    EXPECT_EQ(Ops::lowestBit(all), Ops::one);
}

TYPED_TEST(NumericWidthTest, OneBeyondMaxOverflows) {
    using Ops = NumericOps<TypeParam>;
    if constexpr (sizeof(TypeParam) < 8) {
        const auto beyond =
            std::to_string(static_cast<std::uint64_t>(
                               std::numeric_limits<TypeParam>::max()) +
                           1U);
        EXPECT_EQ(Ops::parseDecimal(beyond).status,
                  NumericParseStatus::Overflow);
    } else {
        EXPECT_EQ(Ops::parseDecimal("99999999999999999999").status,
                  NumericParseStatus::Overflow);
    }
}
