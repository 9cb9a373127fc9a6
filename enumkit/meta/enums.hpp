/*!
 * \file enums.hpp
 * \brief Free-function access to the enum engine
 * \author Max Qian <lightapt.com>
 * \date 2023-03-29
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_ENUMS_HPP
#define ENUMKIT_META_ENUMS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "enumkit/error/exception.hpp"
#include "enumkit/meta/enum_cache.hpp"
#include "enumkit/meta/enum_config.hpp"
#include "enumkit/meta/enum_descriptor.hpp"
#include "enumkit/meta/enum_format.hpp"
#include "enumkit/meta/enum_member.hpp"
#include "enumkit/meta/enum_ranges.hpp"
#include "enumkit/meta/enum_traits.hpp"
#include "enumkit/meta/enum_validation.hpp"
#include "enumkit/meta/numeric.hpp"

namespace enumkit::meta {

// **Type information**

template <typename T>
    requires DeclaredEnum<T>
const EnumDescriptor<T>& enum_descriptor() {
    return EnumCache<T>::get();
}

template <typename T>
    requires DeclaredEnum<T>
bool is_flag_enum() {
    return enum_descriptor<T>().isFlagEnum();
}

/**
 * \brief OR of every declared single-bit value
 */
template <typename T>
    requires DeclaredEnum<T>
T get_all_flags() {
    return enum_descriptor<T>().allFlags();
}

template <typename T>
    requires DeclaredEnum<T>
std::size_t get_member_count(
    EnumMemberSelection selection = EnumMemberSelection::All) {
    return enum_descriptor<T>().memberCount(selection);
}

template <typename T>
    requires DeclaredEnum<T>
MemberRange<T> get_members(
    EnumMemberSelection selection = EnumMemberSelection::All) {
    return enum_descriptor<T>().members(selection);
}

template <typename T>
    requires DeclaredEnum<T>
std::vector<std::string_view> get_names(
    EnumMemberSelection selection = EnumMemberSelection::All) {
    return enum_descriptor<T>().names(selection);
}

// **Member access**

/**
 * \brief Primary member declared with value, nullptr if none
 */
template <typename T>
    requires DeclaredEnum<T>
const EnumMember<T>* get_member(T value) {
    return enum_descriptor<T>().getMember(value);
}

template <typename T>
    requires DeclaredEnum<T>
const EnumMember<T>* get_member(std::string_view name,
                                bool ignore_case = false) {
    return enum_descriptor<T>().getMember(name, ignore_case);
}

/**
 * \brief Name of the primary member, empty for undeclared values
 */
template <typename T>
    requires DeclaredEnum<T>
std::string_view enum_name(T value) {
    const auto* member = get_member(value);
    return member != nullptr ? member->name() : std::string_view{};
}

template <typename T>
    requires DeclaredEnum<T>
std::optional<std::string_view> enum_description(T value) {
    const auto* member = get_member(value);
    if (member == nullptr) {
        return std::nullopt;
    }
    return member->description();
}

/**
 * \brief First metadata item of type A on the member of value
 */
template <typename T, typename A>
    requires DeclaredEnum<T>
const A* get_attribute(T value) {
    const auto* member = get_member(value);
    return member != nullptr ? member->template getAttribute<A>() : nullptr;
}

// **Validation and conversion**

template <typename T>
    requires DeclaredEnum<T>
bool is_defined(T value) {
    return enum_descriptor<T>().isDefined(value);
}

template <typename T>
    requires DeclaredEnum<T>
bool is_valid(T value, EnumValidation validation = EnumValidation::Default) {
    return enum_descriptor<T>().isValid(value, validation);
}

template <typename T>
    requires DeclaredEnum<T>
T validate(T value, EnumValidation validation = EnumValidation::Default) {
    return enum_descriptor<T>().validate(value, validation);
}

/**
 * \brief Converts an integer of any width into T, checking the range
 */
template <typename T, typename I>
    requires DeclaredEnum<T> && std::is_integral_v<I>
T to_object(I value, EnumValidation validation = EnumValidation::None) {
    if constexpr (std::is_signed_v<I>) {
        return enum_descriptor<T>().toObject(static_cast<std::int64_t>(value),
                                             validation);
    } else {
        return enum_descriptor<T>().toObject(static_cast<std::uint64_t>(value),
                                             validation);
    }
}

template <typename T, typename I>
    requires DeclaredEnum<T> && std::is_integral_v<I>
std::optional<T> try_to_object(
    I value, EnumValidation validation = EnumValidation::None) {
    if constexpr (std::is_signed_v<I>) {
        return enum_descriptor<T>().tryToObject(
            static_cast<std::int64_t>(value), validation);
    } else {
        return enum_descriptor<T>().tryToObject(
            static_cast<std::uint64_t>(value), validation);
    }
}

// **Formatting**

template <typename T>
    requires DeclaredEnum<T>
std::string as_string(T value) {
    return enum_descriptor<T>().asString(value);
}

template <typename T>
    requires DeclaredEnum<T>
std::optional<std::string> as_string(T value, const FormatOrder& formats) {
    return enum_descriptor<T>().format(value, formats);
}

/**
 * \brief Formats with a one letter specifier, case-insensitive
 *
 * "G" renders like as_string, "F" always renders as a flag list, "D" in
 * decimal and "X" in hexadecimal.
 *
 * \throws error::InvalidArgument for any other specifier
 */
template <typename T>
    requires DeclaredEnum<T>
std::string format(T value, std::string_view specifier) {
    using Ops = NumericOps<std::underlying_type_t<T>>;
    if (specifier.size() == 1) {
        switch (specifier.front()) {
            case 'G':
            case 'g':
                return enum_descriptor<T>().asString(value);
            case 'F':
            case 'f':
                return enum_descriptor<T>().formatFlags(value);
            case 'D':
            case 'd':
                return Ops::toDecimalString(
                    static_cast<std::underlying_type_t<T>>(value));
            case 'X':
            case 'x':
                return Ops::toHexString(
                    static_cast<std::underlying_type_t<T>>(value));
            default:
                break;
        }
    }
    THROW_INVALID_ARGUMENT("Format specifier must be one of G, F, D or X, got '",
                           specifier, "'");
}

/**
 * \brief Registers a formatter in the process-wide registry
 */
inline EnumFormat register_custom_format(CustomFormatter formatter) {
    return FormatRegistry::global().registerFormat(std::move(formatter));
}

// **Parsing**

template <typename T>
    requires DeclaredEnum<T>
T parse(std::string_view text, bool ignore_case = false) {
    return enum_descriptor<T>().parse(text, ignore_case);
}

template <typename T>
    requires DeclaredEnum<T>
T parse(std::string_view text, bool ignore_case, const FormatOrder& formats) {
    return enum_descriptor<T>().parse(text, ignore_case, formats);
}

template <typename T>
    requires DeclaredEnum<T>
std::optional<T> try_parse(std::string_view text, bool ignore_case = false) {
    return enum_descriptor<T>().tryParse(text, ignore_case);
}

template <typename T>
    requires DeclaredEnum<T>
std::optional<T> try_parse(std::string_view text, bool ignore_case,
                           const FormatOrder& formats) {
    return enum_descriptor<T>().tryParse(text, ignore_case, formats);
}

template <typename T>
    requires DeclaredEnum<T>
const EnumMember<T>& parse_member(
    std::string_view text, bool ignore_case = false,
    const FormatOrder& formats = {EnumFormat::Name, EnumFormat::DecimalValue}) {
    return enum_descriptor<T>().parseMember(text, ignore_case, formats);
}

// **Flag operations**

template <typename T>
    requires DeclaredEnum<T>
bool is_valid_flag_combination(T value) {
    return enum_descriptor<T>().isValidFlagCombination(value);
}

template <typename T>
    requires DeclaredEnum<T>
bool has_any_flags(T value) {
    return enum_descriptor<T>().hasAnyFlags(value);
}

template <typename T>
    requires DeclaredEnum<T>
bool has_any_flags(T value, T flags) {
    return EnumDescriptor<T>::hasAnyFlags(value, flags);
}

template <typename T>
    requires DeclaredEnum<T>
bool has_all_flags(T value) {
    return enum_descriptor<T>().hasAllFlags(value);
}

template <typename T>
    requires DeclaredEnum<T>
bool has_all_flags(T value, T flags) {
    return EnumDescriptor<T>::hasAllFlags(value, flags);
}

template <typename T, typename... Rest>
    requires DeclaredEnum<T> && (std::is_same_v<Rest, T> && ...)
T combine_flags(T first, Rest... rest) {
    return EnumDescriptor<T>::combineFlags(first, rest...);
}

template <typename T>
    requires DeclaredEnum<T>
T common_flags(T value, T flags) {
    return EnumDescriptor<T>::commonFlags(value, flags);
}

template <typename T>
    requires DeclaredEnum<T>
T remove_flags(T value, T flags) {
    return EnumDescriptor<T>::removeFlags(value, flags);
}

template <typename T>
    requires DeclaredEnum<T>
T toggle_flags(T value) {
    return enum_descriptor<T>().toggleFlags(value);
}

template <typename T>
    requires DeclaredEnum<T>
T toggle_flags(T value, T flags) {
    return EnumDescriptor<T>::toggleFlags(value, flags);
}

template <typename T>
    requires DeclaredEnum<T>
FlagRange<T> get_flags(T value) {
    return EnumDescriptor<T>::getFlags(value);
}

template <typename T>
    requires DeclaredEnum<T>
int get_flag_count(T value) {
    return EnumDescriptor<T>::getFlagCount(value);
}

template <typename T>
    requires DeclaredEnum<T>
std::vector<const EnumMember<T>*> get_flag_members(T value) {
    return enum_descriptor<T>().getFlagMembers(value);
}

template <typename T>
    requires DeclaredEnum<T>
std::string format_flags(
    T value, std::string_view delimiter = EnumConfig::default_flag_delimiter) {
    return enum_descriptor<T>().formatFlags(value, delimiter);
}

template <typename T>
    requires DeclaredEnum<T>
std::optional<std::string> format_flags(T value, std::string_view delimiter,
                                        const FormatOrder& formats) {
    return enum_descriptor<T>().formatFlags(value, delimiter, formats);
}

template <typename T>
    requires DeclaredEnum<T>
T parse_flags(std::string_view text, bool ignore_case = false,
              std::string_view delimiter = {}) {
    return enum_descriptor<T>().parseFlags(text, ignore_case, delimiter);
}

template <typename T>
    requires DeclaredEnum<T>
T parse_flags(std::string_view text, bool ignore_case,
              std::string_view delimiter, const FormatOrder& formats) {
    return enum_descriptor<T>().parseFlags(text, ignore_case, delimiter,
                                           formats);
}

template <typename T>
    requires DeclaredEnum<T>
std::optional<T> try_parse_flags(
    std::string_view text, bool ignore_case = false,
    std::string_view delimiter = {},
    const FormatOrder& formats = {EnumFormat::Name, EnumFormat::DecimalValue}) {
    return enum_descriptor<T>().tryParseFlags(text, ignore_case, delimiter,
                                              formats);
}

}  // namespace enumkit::meta

/**
 * \brief Defines the bitwise operators for a flag enum declared with
 * ENUMKIT_ENUM_TRAITS
 */
#define ENUMKIT_FLAG_OPERATORS(EnumType)                                   \
    constexpr EnumType operator|(EnumType lhs, EnumType rhs) noexcept {    \
        using UT = std::underlying_type_t<EnumType>;                       \
        return static_cast<EnumType>(static_cast<UT>(lhs) |                \
                                     static_cast<UT>(rhs));                \
    }                                                                      \
    constexpr EnumType operator&(EnumType lhs, EnumType rhs) noexcept {    \
        using UT = std::underlying_type_t<EnumType>;                       \
        return static_cast<EnumType>(static_cast<UT>(lhs) &                \
                                     static_cast<UT>(rhs));                \
    }                                                                      \
    constexpr EnumType operator^(EnumType lhs, EnumType rhs) noexcept {    \
        using UT = std::underlying_type_t<EnumType>;                       \
        return static_cast<EnumType>(static_cast<UT>(lhs) ^                \
                                     static_cast<UT>(rhs));                \
    }                                                                      \
    constexpr EnumType operator~(EnumType value) noexcept {                \
        using UT = std::underlying_type_t<EnumType>;                       \
        return static_cast<EnumType>(~static_cast<UT>(value));             \
    }                                                                      \
    constexpr EnumType& operator|=(EnumType& lhs, EnumType rhs) noexcept { \
        return lhs = lhs | rhs;                                            \
    }                                                                      \
    constexpr EnumType& operator&=(EnumType& lhs, EnumType rhs) noexcept { \
        return lhs = lhs & rhs;                                            \
    }                                                                      \
    constexpr EnumType& operator^=(EnumType& lhs, EnumType rhs) noexcept { \
        return lhs = lhs ^ rhs;                                            \
    }

#endif  // ENUMKIT_META_ENUMS_HPP
