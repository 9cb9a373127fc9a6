/*!
 * \file enum_member.hpp
 * \brief Declared enum members and the metadata attached to them
 * \author Max Qian <lightapt.com>
 * \date 2024-03-02
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_ENUM_MEMBER_HPP
#define ENUMKIT_META_ENUM_MEMBER_HPP

#include <any>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace enumkit::meta {

/**
 * @brief Built-in metadata item rendered by EnumFormat::Description.
 */
struct Description {
    std::string text;
};

// Ordered, opaque metadata items attached to a member at declaration.
using Metadata = std::vector<std::any>;

/**
 * @brief Width-independent view of a declared member.
 *
 * Custom formatters and other metadata consumers receive this type, so one
 * formatter serves every enumeration regardless of its underlying type.
 */
class MemberInfo {
public:
    MemberInfo(std::string name, Metadata metadata, bool primary,
               std::uint64_t bits, bool isSigned)
        : name_(std::move(name)),
          metadata_(std::move(metadata)),
          bits_(bits),
          primary_(primary),
          signed_(isSigned) {}

    [[nodiscard]] auto name() const noexcept -> std::string_view {
        return name_;
    }

    [[nodiscard]] auto metadata() const noexcept -> const Metadata& {
        return metadata_;
    }

    /**
     * @brief Whether this member is the canonical one for its value.
     *
     * Exactly one member per distinct value is primary once the descriptor is
     * built: the explicitly marked one, otherwise the first declared.
     */
    [[nodiscard]] auto isPrimary() const noexcept -> bool { return primary_; }

    [[nodiscard]] auto isSigned() const noexcept -> bool { return signed_; }

    // Sign-extended value for signed enums, zero-extended otherwise.
    [[nodiscard]] auto toInt64() const noexcept -> std::int64_t {
        return static_cast<std::int64_t>(bits_);
    }

    [[nodiscard]] auto toUInt64() const noexcept -> std::uint64_t {
        return bits_;
    }

    /**
     * @brief First metadata item of type A.
     *
     * @return Pointer to the item, nullptr if none is attached.
     */
    template <typename A>
    [[nodiscard]] auto getAttribute() const noexcept -> const A* {
        for (const auto& item : metadata_) {
            if (const auto* attr = std::any_cast<A>(&item)) {
                return attr;
            }
        }
        return nullptr;
    }

    template <typename A>
    [[nodiscard]] auto hasAttribute() const noexcept -> bool {
        return getAttribute<A>() != nullptr;
    }

    template <typename A>
    [[nodiscard]] auto getAttributes() const -> std::vector<const A*> {
        std::vector<const A*> result;
        for (const auto& item : metadata_) {
            if (const auto* attr = std::any_cast<A>(&item)) {
                result.push_back(attr);
            }
        }
        return result;
    }

    [[nodiscard]] auto description() const noexcept
        -> std::optional<std::string_view> {
        if (const auto* desc = getAttribute<Description>()) {
            return std::string_view(desc->text);
        }
        return std::nullopt;
    }

private:
    std::string name_;
    Metadata metadata_;
    std::uint64_t bits_;
    bool primary_;
    bool signed_;
};

/**
 * @brief A declared member of enumeration E.
 */
template <typename E>
class EnumMember : public MemberInfo {
public:
    using enum_type = E;
    using underlying_type = std::underlying_type_t<E>;

    EnumMember(E value, std::string name, Metadata metadata, bool primary)
        : MemberInfo(std::move(name), std::move(metadata), primary,
                     static_cast<std::uint64_t>(
                         static_cast<underlying_type>(value)),
                     std::is_signed_v<underlying_type>),
          value_(value) {}

    [[nodiscard]] auto value() const noexcept -> E { return value_; }

    [[nodiscard]] auto underlying() const noexcept -> underlying_type {
        return static_cast<underlying_type>(value_);
    }

private:
    E value_;
};

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_MEMBER_HPP
