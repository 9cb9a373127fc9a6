#include <gtest/gtest.h>

#include "enumkit/meta/enums.hpp"
#include "test_enums.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace enumkit::meta;
using namespace enumkit::test;

class EnumsTest : public ::testing::Test {};

TEST_F(EnumsTest, TypeQueries) {
    EXPECT_TRUE(is_flag_enum<DaysOfWeek>());
    EXPECT_FALSE(is_flag_enum<NumericOperator>());
    EXPECT_EQ(get_member_count<NumericOperator>(), 6U);
    EXPECT_EQ(get_member_count<NumericOperator>(EnumMemberSelection::Distinct),
              5U);
    EXPECT_EQ(get_member_count<NumericOperator>(EnumMemberSelection::Flags),
              3U);
    EXPECT_EQ(get_member_count<Nothing>(), 0U);
}

TEST_F(EnumsTest, Names) {
    EXPECT_EQ(get_names<Temperature>(),
              (std::vector<std::string_view>{"Freezing", "Cold", "Mild",
                                             "Hot"}));
    EXPECT_EQ(enum_name(NumericOperator::NotLessThan), "GreaterThanOrEquals");
    EXPECT_TRUE(enum_name(static_cast<NumericOperator>(42)).empty());
}

TEST_F(EnumsTest, MemberLookup) {
    const auto* byName = get_member<DaysOfWeek>("Thursday");
    ASSERT_NE(byName, nullptr);
    EXPECT_EQ(byName->value(), DaysOfWeek::Thursday);
    EXPECT_EQ(byName->underlying(), 16);
    EXPECT_EQ(byName->toInt64(), 16);
    EXPECT_EQ(get_member<DaysOfWeek>("thursday"), nullptr);
    EXPECT_EQ(get_member<DaysOfWeek>("thursday", true), byName);
    EXPECT_EQ(get_member(DaysOfWeek::Thursday), byName);
}

TEST_F(EnumsTest, SignedMemberValues) {
    const auto* freezing = get_member(Temperature::Freezing);
    ASSERT_NE(freezing, nullptr);
    EXPECT_TRUE(freezing->isSigned());
    EXPECT_EQ(freezing->toInt64(), -40);

    const auto* admin = get_member(Capability::Admin);
    ASSERT_NE(admin, nullptr);
    EXPECT_FALSE(admin->isSigned());
    EXPECT_EQ(admin->toUInt64(), 1ULL << 63);
}

TEST_F(EnumsTest, MembersInValueOrder) {
    std::vector<std::string_view> names;
    for (const auto& member : get_members<DaysOfWeek>(EnumMemberSelection::Flags)) {
        names.push_back(member.name());
    }
    EXPECT_EQ(names.front(), "Sunday");
    EXPECT_EQ(names.back(), "Saturday");
    EXPECT_EQ(names.size(), 7U);
}

TEST_F(EnumsTest, Descriptions) {
    EXPECT_EQ(enum_description(DaysOfWeek::Sunday), "First day of the week");
    EXPECT_FALSE(enum_description(DaysOfWeek::Monday).has_value());
    EXPECT_FALSE(enum_description(static_cast<DaysOfWeek>(3)).has_value());
}

TEST_F(EnumsTest, Attributes) {
    const auto* symbol = get_attribute<NumericOperator, Symbol>(
        NumericOperator::NotLessThan);
    ASSERT_NE(symbol, nullptr);
    EXPECT_EQ(symbol->text, ">=");
    EXPECT_EQ((get_attribute<NumericOperator, Symbol>(NumericOperator::LessThan)),
              nullptr);
    EXPECT_EQ((get_attribute<NumericOperator, Description>(
                  NumericOperator::Equals)
                   ->text),
              "Is equal to");

    const auto* equals = get_member(NumericOperator::Equals);
    ASSERT_NE(equals, nullptr);
    EXPECT_EQ(equals->getAttributes<Symbol>().size(), 1U);
    EXPECT_TRUE(equals->hasAttribute<Description>());
}

TEST_F(EnumsTest, WeekScenario) {
    const auto saturdaySunday = static_cast<DaysOfWeek>(65);
    std::vector<DaysOfWeek> flags;
    for (auto flag : get_flags(saturdaySunday)) {
        flags.push_back(flag);
    }
    EXPECT_EQ(flags, (std::vector<DaysOfWeek>{DaysOfWeek::Sunday,
                                              DaysOfWeek::Saturday}));
    EXPECT_TRUE(has_all_flags(static_cast<DaysOfWeek>(3), DaysOfWeek::Sunday));
    EXPECT_EQ(static_cast<int>(combine_flags(
                  DaysOfWeek::Sunday, DaysOfWeek::Monday, DaysOfWeek::Saturday)),
              67);
}

TEST_F(EnumsTest, CustomSymbolScenario) {
    auto symbol = register_custom_format([](const MemberInfo& member) {
        const auto* item = member.getAttribute<Symbol>();
        return item != nullptr ? item->text : std::string{};
    });
    EXPECT_EQ(as_string(NumericOperator::NotEquals, {symbol}), "!=");
    EXPECT_FALSE(as_string(NumericOperator::LessThan, {symbol}).has_value());
    EXPECT_EQ(as_string(NumericOperator::LessThan, {symbol, EnumFormat::Name}),
              "LessThan");
    EXPECT_EQ(parse<NumericOperator>("!=", false, {symbol}),
              NumericOperator::NotEquals);
}
