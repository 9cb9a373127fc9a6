/*!
 * \file enum_format.hpp
 * \brief Format specifiers and the registry of custom member formatters
 * \author Max Qian <lightapt.com>
 * \date 2024-03-02
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_ENUM_FORMAT_HPP
#define ENUMKIT_META_ENUM_FORMAT_HPP

#include <concepts>
#include <cstddef>
#include <deque>
#include <functional>
#include <initializer_list>
#include <shared_mutex>
#include <span>
#include <string>
#include <type_traits>

#include <boost/container/small_vector.hpp>

#include "enumkit/meta/enum_config.hpp"
#include "enumkit/meta/enum_member.hpp"

namespace enumkit::meta {

/**
 * @brief How a value is rendered to or resolved from text.
 *
 * Values from EnumConfig::first_custom_format upwards are identifiers handed
 * out by a FormatRegistry.
 */
enum class EnumFormat : int {
    DecimalValue = 0,
    HexadecimalValue = 1,
    UnderlyingValue = 2,
    Name = 3,
    Description = 4,
};

/**
 * @brief Ordered list of formats to try, first producing format wins.
 *
 * Binds to a braced list at the call site as well as to any contiguous
 * container of EnumFormat. The formats are copied into inline storage, so an
 * order may be kept in a local variable and reused.
 */
class FormatOrder {
public:
    using storage_type =
        boost::container::small_vector<EnumFormat,
                                       EnumConfig::inline_format_capacity>;

    FormatOrder() = default;

    FormatOrder(std::initializer_list<EnumFormat> formats)
        : formats_(formats.begin(), formats.end()) {}

    template <std::size_t N>
    FormatOrder(const EnumFormat (&formats)[N])
        : formats_(formats, formats + N) {}

    template <typename R>
        requires(!std::same_as<std::remove_cvref_t<R>, FormatOrder>) &&
                requires(const R& r) {
                    { r.data() } -> std::convertible_to<const EnumFormat*>;
                    { r.size() } -> std::convertible_to<std::size_t>;
                }
    FormatOrder(const R& formats)
        : formats_(formats.data(), formats.data() + formats.size()) {}

    void push_back(EnumFormat format) { formats_.push_back(format); }

    [[nodiscard]] auto begin() const noexcept { return formats_.begin(); }
    [[nodiscard]] auto end() const noexcept { return formats_.end(); }
    [[nodiscard]] auto size() const noexcept { return formats_.size(); }
    [[nodiscard]] auto empty() const noexcept { return formats_.empty(); }
    [[nodiscard]] auto span() const noexcept -> std::span<const EnumFormat> {
        return {formats_.data(), formats_.size()};
    }

private:
    storage_type formats_;
};

[[nodiscard]] constexpr auto isBuiltinFormat(EnumFormat format) noexcept
    -> bool {
    return static_cast<int>(format) >= static_cast<int>(EnumFormat::DecimalValue) &&
           static_cast<int>(format) <= static_cast<int>(EnumFormat::Description);
}

// Human readable label of a format, "Name" or "Custom(101)".
[[nodiscard]] auto formatLabel(EnumFormat format) -> std::string;

// Comma separated labels of a format order, for diagnostics.
[[nodiscard]] auto describeFormats(std::span<const EnumFormat> formats)
    -> std::string;

/**
 * @brief Renders a member to text; an empty result means "no representation"
 * and lets the next format in the order be tried.
 */
using CustomFormatter = std::function<std::string(const MemberInfo&)>;

/**
 * @brief Append-only list of custom formatters.
 *
 * Each registration receives the next identifier, starting at
 * EnumConfig::first_custom_format. Identifiers are never reused and stay valid
 * for the lifetime of the registry. Registration and resolution may happen
 * concurrently.
 */
class FormatRegistry {
public:
    FormatRegistry() = default;
    FormatRegistry(const FormatRegistry&) = delete;
    auto operator=(const FormatRegistry&) -> FormatRegistry& = delete;

    /**
     * @brief Process-wide registry used when no registry is passed explicitly.
     */
    static auto global() -> FormatRegistry&;

    /**
     * @brief Appends a formatter.
     *
     * @param formatter The formatter, must not be empty.
     * @return The identifier to use wherever a format is accepted.
     * @throws error::InvalidArgument If formatter is empty.
     */
    auto registerFormat(CustomFormatter formatter) -> EnumFormat;

    /**
     * @brief Looks up a registered formatter in constant time.
     *
     * @throws error::InvalidArgument If format was not handed out by this
     * registry.
     */
    [[nodiscard]] auto resolve(EnumFormat format) const
        -> const CustomFormatter&;

    [[nodiscard]] auto contains(EnumFormat format) const -> bool;

    // Built-in, or registered here.
    [[nodiscard]] auto isValid(EnumFormat format) const -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    mutable std::shared_mutex mutex_;
    // deque keeps references to existing entries valid across appends
    std::deque<CustomFormatter> formatters_;
};

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_FORMAT_HPP
