/*!
 * \file enum_config.hpp
 * \brief Compile-time settings of the enum engine
 * \author Max Qian <lightapt.com>
 * \date 2024-03-02
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_ENUM_CONFIG_HPP
#define ENUMKIT_META_ENUM_CONFIG_HPP

#include <cstddef>
#include <string_view>

namespace enumkit::meta {

/**
 * @brief Configuration options for the enum utilities
 */
struct EnumConfig {
    // Joins flag names when a flag combination is rendered
    static constexpr std::string_view default_flag_delimiter = ", ";

    // Splits flag lists when parsing, the format delimiter without spaces
    static constexpr std::string_view flag_parse_delimiter = ",";

    // First identifier handed out by a FormatRegistry, below it the built-in
    // formats live
    static constexpr int first_custom_format = 100;

    // Format orders up to this length are kept without heap allocation
    static constexpr std::size_t inline_format_capacity = 4;
};

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_CONFIG_HPP
