/*!
 * \file enum_validation.hpp
 * \brief Validation modes for raw enum values
 * \author Max Qian <lightapt.com>
 * \date 2024-03-02
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_ENUM_VALIDATION_HPP
#define ENUMKIT_META_ENUM_VALIDATION_HPP

namespace enumkit::meta {

/**
 * @brief Which rule decides whether a raw value is legal.
 */
enum class EnumValidation {
    // Everything is accepted.
    None = 0,
    // A declared value, or for flag enums also any combination of declared
    // flags; a custom validator accepting the value always wins.
    Default = 1,
    // Only declared values.
    IsDefined = 2,
    // Only combinations of declared single-bit flags.
    IsValidFlagCombination = 3,
};

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_VALIDATION_HPP
