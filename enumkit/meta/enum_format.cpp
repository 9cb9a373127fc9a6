/*
 * enum_format.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-03-02

Description: Format labels and the custom formatter registry

**************************************************/

#include "enum_format.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

#include "enumkit/error/exception.hpp"

namespace enumkit::meta {

auto formatLabel(EnumFormat format) -> std::string {
    switch (format) {
        case EnumFormat::DecimalValue:
            return "DecimalValue";
        case EnumFormat::HexadecimalValue:
            return "HexadecimalValue";
        case EnumFormat::UnderlyingValue:
            return "UnderlyingValue";
        case EnumFormat::Name:
            return "Name";
        case EnumFormat::Description:
            return "Description";
    }
    return fmt::format("Custom({})", static_cast<int>(format));
}

auto describeFormats(std::span<const EnumFormat> formats) -> std::string {
    std::string result;
    for (const auto format : formats) {
        if (!result.empty()) {
            result += ", ";
        }
        result += formatLabel(format);
    }
    return result;
}

auto FormatRegistry::global() -> FormatRegistry& {
    static FormatRegistry instance;
    return instance;
}

auto FormatRegistry::registerFormat(CustomFormatter formatter) -> EnumFormat {
    if (!formatter) {
        THROW_INVALID_ARGUMENT("Custom formatter must not be empty");
    }

    EnumFormat format;
    {
        std::unique_lock lock(mutex_);
        format = static_cast<EnumFormat>(
            EnumConfig::first_custom_format +
            static_cast<int>(formatters_.size()));
        formatters_.push_back(std::move(formatter));
    }
    spdlog::info("Registered custom enum format {}", static_cast<int>(format));
    return format;
}

auto FormatRegistry::resolve(EnumFormat format) const
    -> const CustomFormatter& {
    const auto index =
        static_cast<int>(format) - EnumConfig::first_custom_format;
    std::shared_lock lock(mutex_);
    if (index < 0 || static_cast<std::size_t>(index) >= formatters_.size()) {
        THROW_INVALID_ARGUMENT("Unknown enum format ", static_cast<int>(format));
    }
    return formatters_[static_cast<std::size_t>(index)];
}

auto FormatRegistry::contains(EnumFormat format) const -> bool {
    const auto index =
        static_cast<int>(format) - EnumConfig::first_custom_format;
    std::shared_lock lock(mutex_);
    return index >= 0 && static_cast<std::size_t>(index) < formatters_.size();
}

auto FormatRegistry::isValid(EnumFormat format) const -> bool {
    return isBuiltinFormat(format) || contains(format);
}

auto FormatRegistry::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return formatters_.size();
}

}  // namespace enumkit::meta
