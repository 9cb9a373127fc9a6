// tests/meta/test_enums.hpp
#ifndef ENUMKIT_TEST_ENUMS_HPP
#define ENUMKIT_TEST_ENUMS_HPP

#include <cstdint>
#include <string>

#include "enumkit/meta/enums.hpp"

namespace enumkit::test {

using meta::Description;
using meta::EnumDeclaration;

// Flag enum with named composites and an explicit primary among aliases
enum class DaysOfWeek : std::int32_t {
    None = 0,
    Sunday = 1,
    Monday = 2,
    Tuesday = 4,
    Wednesday = 8,
    Thursday = 16,
    Friday = 32,
    Saturday = 64,
    Weekend = Sunday | Saturday,
    Weekdays = Monday | Tuesday | Wednesday | Thursday | Friday,
    Everyday = Weekend | Weekdays,
};

ENUMKIT_FLAG_OPERATORS(DaysOfWeek)

enum class NumericOperator : std::uint8_t {
    Equals = 0,
    NotEquals = 1,
    GreaterThan = 2,
    GreaterThanOrEquals = 3,
    NotLessThan = 3,
    LessThan = 4,
};

// Metadata item a custom formatter can render
struct Symbol {
    std::string text;
};

// Signed, non-contiguous, with a negative member
enum class Temperature : std::int8_t {
    Freezing = -40,
    Cold = -5,
    Mild = 15,
    Hot = 40,
};

// Unsigned 64-bit flags using the top bit
enum class Capability : std::uint64_t {
    None = 0,
    Read = 1ULL << 0,
    Write = 1ULL << 1,
    Admin = 1ULL << 63,
};

ENUMKIT_FLAG_OPERATORS(Capability)

// Declared with no members at all
enum class Nothing : std::int16_t {};

// Gaps filled by a custom validator
enum class Priority : std::uint16_t {
    Low = 1,
    Medium = 2,
    High = 3,
};

// Flag enum whose sign bit is a declared flag
enum class SignedFlags : std::int8_t {
    Alpha = 1,
    Beta = 2,
    Sign = -128,
};

// Case variants of one name
enum class Mode : std::int32_t {
    Fast = 1,
    FAST = 2,
    Slow = 3,
};

}  // namespace enumkit::test

ENUMKIT_ENUM_TRAITS(enumkit::test::DaysOfWeek,
                    EnumDeclaration<enumkit::test::DaysOfWeek>("DaysOfWeek")
                        .flags()
                        .member("None", enumkit::test::DaysOfWeek::None)
                        .member("Sunday", enumkit::test::DaysOfWeek::Sunday,
                                Description{"First day of the week"})
                        .member("Monday", enumkit::test::DaysOfWeek::Monday)
                        .member("Tuesday", enumkit::test::DaysOfWeek::Tuesday)
                        .member("Wednesday",
                                enumkit::test::DaysOfWeek::Wednesday,
                                Description{"Hump day"})
                        .member("Thursday", enumkit::test::DaysOfWeek::Thursday)
                        .member("Friday", enumkit::test::DaysOfWeek::Friday)
                        .member("Saturday", enumkit::test::DaysOfWeek::Saturday)
                        .member("Weekend", enumkit::test::DaysOfWeek::Weekend)
                        .member("Weekdays", enumkit::test::DaysOfWeek::Weekdays)
                        .member("Everyday",
                                enumkit::test::DaysOfWeek::Everyday));

ENUMKIT_ENUM_TRAITS(
    enumkit::test::NumericOperator,
    EnumDeclaration<enumkit::test::NumericOperator>("NumericOperator")
        .member("Equals", enumkit::test::NumericOperator::Equals,
                enumkit::test::Symbol{"=="}, Description{"Is equal to"})
        .member("NotEquals", enumkit::test::NumericOperator::NotEquals,
                enumkit::test::Symbol{"!="})
        .member("GreaterThan", enumkit::test::NumericOperator::GreaterThan,
                enumkit::test::Symbol{">"})
        .member("NotLessThan", enumkit::test::NumericOperator::NotLessThan)
        .primary("GreaterThanOrEquals",
                 enumkit::test::NumericOperator::GreaterThanOrEquals,
                 enumkit::test::Symbol{">="})
        .member("LessThan", enumkit::test::NumericOperator::LessThan));

ENUMKIT_ENUM_TRAITS(
    enumkit::test::Temperature,
    EnumDeclaration<enumkit::test::Temperature>("Temperature")
        .member("Mild", enumkit::test::Temperature::Mild)
        .member("Freezing", enumkit::test::Temperature::Freezing)
        .member("Hot", enumkit::test::Temperature::Hot)
        .member("Cold", enumkit::test::Temperature::Cold));

ENUMKIT_ENUM_TRAITS(
    enumkit::test::Capability,
    EnumDeclaration<enumkit::test::Capability>("Capability")
        .flags()
        .member("None", enumkit::test::Capability::None)
        .member("Read", enumkit::test::Capability::Read)
        .member("Write", enumkit::test::Capability::Write)
        .member("Admin", enumkit::test::Capability::Admin));

ENUMKIT_ENUM_TRAITS(enumkit::test::Nothing,
                    EnumDeclaration<enumkit::test::Nothing>("Nothing"));

ENUMKIT_ENUM_TRAITS(
    enumkit::test::Priority,
    EnumDeclaration<enumkit::test::Priority>("Priority")
        .member("Low", enumkit::test::Priority::Low)
        .member("Medium", enumkit::test::Priority::Medium)
        .member("High", enumkit::test::Priority::High)
        .validator([](enumkit::test::Priority value) {
            return static_cast<std::uint16_t>(value) % 100 == 0;
        }));

ENUMKIT_ENUM_TRAITS(
    enumkit::test::SignedFlags,
    EnumDeclaration<enumkit::test::SignedFlags>("SignedFlags")
        .flags()
        .member("Alpha", enumkit::test::SignedFlags::Alpha)
        .member("Beta", enumkit::test::SignedFlags::Beta)
        .member("Sign", enumkit::test::SignedFlags::Sign));

ENUMKIT_ENUM_TRAITS(enumkit::test::Mode,
                    EnumDeclaration<enumkit::test::Mode>("Mode")
                        .member("Fast", enumkit::test::Mode::Fast)
                        .member("FAST", enumkit::test::Mode::FAST)
                        .member("Slow", enumkit::test::Mode::Slow));

#endif  // ENUMKIT_TEST_ENUMS_HPP
