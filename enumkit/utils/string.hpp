/*
 * string.hpp
 *
 * Copyright (C) 2023-2024 Max Q. <contact@lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: String helpers shared by the enum name indexes and parsers

**************************************************/

#ifndef ENUMKIT_UTILS_STRING_HPP
#define ENUMKIT_UTILS_STRING_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace enumkit::utils {

/**
 * @brief Removes leading and trailing whitespace without copying.
 *
 * @param str The string to trim.
 * @return A view into @p str without surrounding whitespace.
 */
[[nodiscard]] auto trim(std::string_view str) noexcept -> std::string_view;

/**
 * @brief Compares two strings ignoring ASCII case.
 *
 * Uses the classic locale, so the result does not change with the global
 * locale.
 */
[[nodiscard]] auto iequals(std::string_view lhs, std::string_view rhs) -> bool;

// Hash consistent with iequals, for case-insensitive unordered containers.
struct CaseInsensitiveHash {
    using is_transparent = void;
    auto operator()(std::string_view str) const noexcept -> std::size_t;
};

struct CaseInsensitiveEqual {
    using is_transparent = void;
    auto operator()(std::string_view lhs, std::string_view rhs) const
        -> bool {
        return iequals(lhs, rhs);
    }
};

}  // namespace enumkit::utils

#endif  // ENUMKIT_UTILS_STRING_HPP
