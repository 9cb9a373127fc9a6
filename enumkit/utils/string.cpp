/*
 * string.cpp
 *
 * Copyright (C) 2023-2024 Max Q. <contact@lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: String helpers shared by the enum name indexes and parsers

**************************************************/

#include "string.hpp"

#include <algorithm>
#include <cctype>
#include <locale>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/functional/hash.hpp>

namespace enumkit::utils {

auto trim(std::string_view str) noexcept -> std::string_view {
    const auto isspaceFn = [](unsigned char c) { return std::isspace(c) != 0; };

    auto start = std::ranges::find_if_not(str, isspaceFn);
    if (start == str.end()) {
        return {};
    }
    auto end = std::find_if_not(str.rbegin(), str.rend(), isspaceFn).base();
    return {start, end};
}

auto iequals(std::string_view lhs, std::string_view rhs) -> bool {
    return boost::algorithm::iequals(lhs, rhs, std::locale::classic());
}

auto CaseInsensitiveHash::operator()(std::string_view str) const noexcept
    -> std::size_t {
    const auto& loc = std::locale::classic();
    std::size_t seed = 0;
    for (char c : str) {
        boost::hash_combine(seed, std::toupper(c, loc));
    }
    return seed;
}

}  // namespace enumkit::utils
