/*!
 * \file numeric.hpp
 * \brief Uniform operations over the integer widths an enum may be backed by
 * \author Max Qian <lightapt.com>
 * \date 2024-03-02
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_NUMERIC_HPP
#define ENUMKIT_META_NUMERIC_HPP

#include <bit>
#include <charconv>
#include <concepts>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace enumkit::meta {

/**
 * @brief Integer types an enumeration may use as its underlying type:
 * signed or unsigned, 8 to 64 bits.
 */
template <typename T>
concept UnderlyingInteger =
    std::integral<T> && !std::same_as<T, bool> &&
    (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8);

enum class NumericParseStatus { Success, Overflow, Invalid };

template <typename T>
struct NumericParseResult {
    NumericParseStatus status = NumericParseStatus::Invalid;
    T value{};

    [[nodiscard]] constexpr auto ok() const noexcept -> bool {
        return status == NumericParseStatus::Success;
    }
};

/**
 * @brief The closed set of integer operations the enum engine is written
 * against.
 *
 * Every higher component goes through this interface, so the cache, the flag
 * algebra and the format/parse pipeline are written once and instantiated per
 * underlying width. Bit operations work on the unsigned representation so the
 * sign bit behaves like any other flag bit.
 *
 * @tparam T The underlying integer type.
 */
template <UnderlyingInteger T>
struct NumericOps {
    using value_type = T;
    using unsigned_type = std::make_unsigned_t<T>;

    static constexpr int bit_width = std::numeric_limits<unsigned_type>::digits;
    static constexpr int hex_digits = static_cast<int>(sizeof(T) * 2);
    static constexpr T zero = T{0};
    static constexpr T one = T{1};

    [[nodiscard]] static constexpr auto toBits(T value) noexcept
        -> unsigned_type {
        return static_cast<unsigned_type>(value);
    }

    [[nodiscard]] static constexpr auto fromBits(unsigned_type bits) noexcept
        -> T {
        return static_cast<T>(bits);
    }

    [[nodiscard]] static constexpr auto compare(T lhs, T rhs) noexcept -> int {
        return lhs < rhs ? -1 : (rhs < lhs ? 1 : 0);
    }

    [[nodiscard]] static constexpr auto bitAnd(T lhs, T rhs) noexcept -> T {
        return fromBits(toBits(lhs) & toBits(rhs));
    }

    [[nodiscard]] static constexpr auto bitOr(T lhs, T rhs) noexcept -> T {
        return fromBits(toBits(lhs) | toBits(rhs));
    }

    [[nodiscard]] static constexpr auto bitXor(T lhs, T rhs) noexcept -> T {
        return fromBits(toBits(lhs) ^ toBits(rhs));
    }

    [[nodiscard]] static constexpr auto bitNot(T value) noexcept -> T {
        return fromBits(static_cast<unsigned_type>(~toBits(value)));
    }

    // Wraps around at the maximum value instead of overflowing.
    [[nodiscard]] static constexpr auto addOne(T value) noexcept -> T {
        return fromBits(static_cast<unsigned_type>(toBits(value) + 1U));
    }

    [[nodiscard]] static constexpr auto popCount(T value) noexcept -> int {
        return std::popcount(toBits(value));
    }

    [[nodiscard]] static constexpr auto isPowerOfTwoOrZero(T value) noexcept
        -> bool {
        const auto bits = toBits(value);
        return static_cast<unsigned_type>(bits & (bits - 1U)) == 0;
    }

    [[nodiscard]] static constexpr auto hasSingleBit(T value) noexcept
        -> bool {
        return std::has_single_bit(toBits(value));
    }

    // Lowest set bit of value, zero when value is zero.
    [[nodiscard]] static constexpr auto lowestBit(T value) noexcept -> T {
        const auto bits = toBits(value);
        return fromBits(static_cast<unsigned_type>(bits & (~bits + 1U)));
    }

    [[nodiscard]] static constexpr auto isInValueRange(std::int64_t value) noexcept
        -> bool {
        return std::in_range<T>(value);
    }

    [[nodiscard]] static constexpr auto isInValueRange(
        std::uint64_t value) noexcept -> bool {
        return std::in_range<T>(value);
    }

    [[nodiscard]] static constexpr auto toInt64(T value) noexcept
        -> std::int64_t {
        return static_cast<std::int64_t>(value);
    }

    [[nodiscard]] static constexpr auto toUInt64(T value) noexcept
        -> std::uint64_t {
        return static_cast<std::uint64_t>(value);
    }

    /**
     * @brief Parses a base-10 literal with an optional leading sign.
     *
     * @return Success with the value, Overflow when the literal is well formed
     * but outside the range of T, Invalid otherwise.
     */
    [[nodiscard]] static auto parseDecimal(std::string_view text) noexcept
        -> NumericParseResult<T> {
        NumericParseResult<T> result;
        if (text.empty()) {
            return result;
        }
        const bool negative = text.front() == '-';
        if (text.front() == '+' || negative) {
            text.remove_prefix(1);
        }
        if (text.empty() || text.front() < '0' || text.front() > '9') {
            return result;
        }

        std::uint64_t magnitude = 0;
        const auto* last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), last, magnitude);
        if (ptr != last) {
            return result;
        }
        if (ec == std::errc::result_out_of_range) {
            result.status = NumericParseStatus::Overflow;
            return result;
        }

        if (!negative) {
            if (!std::in_range<T>(magnitude)) {
                result.status = NumericParseStatus::Overflow;
                return result;
            }
            result.value = static_cast<T>(magnitude);
        } else if (magnitude == 0) {
            result.value = zero;
        } else {
            if constexpr (std::is_unsigned_v<T>) {
                result.status = NumericParseStatus::Overflow;
                return result;
            } else {
                // |min| of T is max + 1
                constexpr auto limit =
                    static_cast<std::uint64_t>(std::numeric_limits<T>::max()) +
                    1U;
                if (magnitude > limit) {
                    result.status = NumericParseStatus::Overflow;
                    return result;
                }
                result.value = static_cast<T>(
                    -static_cast<std::int64_t>(magnitude - 1U) - 1);
            }
        }
        result.status = NumericParseStatus::Success;
        return result;
    }

    /**
     * @brief Parses a base-16 literal, optionally prefixed with 0x.
     *
     * The digits are read as the two's complement bit pattern of T, so "FF"
     * is -1 for an 8-bit signed type.
     */
    [[nodiscard]] static auto parseHex(std::string_view text) noexcept
        -> NumericParseResult<T> {
        NumericParseResult<T> result;
        if (text.size() > 2 && text[0] == '0' &&
            (text[1] == 'x' || text[1] == 'X')) {
            text.remove_prefix(2);
        }
        if (text.empty() || text.front() == '-' || text.front() == '+') {
            return result;
        }

        std::uint64_t bits = 0;
        const auto* last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), last, bits, 16);
        if (ptr != last) {
            return result;
        }
        if (ec == std::errc::result_out_of_range ||
            bits > std::numeric_limits<unsigned_type>::max()) {
            result.status = NumericParseStatus::Overflow;
            return result;
        }
        result.value = fromBits(static_cast<unsigned_type>(bits));
        result.status = NumericParseStatus::Success;
        return result;
    }

    [[nodiscard]] static auto toDecimalString(T value) -> std::string {
        if constexpr (std::is_signed_v<T>) {
            return fmt::format("{}", toInt64(value));
        } else {
            return fmt::format("{}", toUInt64(value));
        }
    }

    // Upper-case, zero padded to the full width of T.
    [[nodiscard]] static auto toHexString(T value) -> std::string {
        return fmt::format("{:0{}X}", static_cast<std::uint64_t>(toBits(value)),
                           hex_digits);
    }
};

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_NUMERIC_HPP
