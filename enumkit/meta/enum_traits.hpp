/*!
 * \file enum_traits.hpp
 * \brief Declaration data an enumeration supplies to the engine
 * \author Max Qian <lightapt.com>
 * \date 2023-03-29
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_ENUM_TRAITS_HPP
#define ENUMKIT_META_ENUM_TRAITS_HPP

#include <any>
#include <concepts>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "enumkit/meta/enum_member.hpp"
#include "enumkit/meta/numeric.hpp"

namespace enumkit::meta {

template <typename T>
concept EnumerationType =
    std::is_enum_v<T> && UnderlyingInteger<std::underlying_type_t<T>>;

/**
 * @brief One declared constant, in declaration order.
 */
template <typename E>
struct MemberDeclaration {
    std::string name;
    E value;
    Metadata metadata;
    bool primary = false;
};

/**
 * @brief Everything the engine learns about an enumeration, gathered once.
 *
 * Built fluently inside an EnumTraits<E>::declare() specialization:
 * \code
 * return EnumDeclaration<Days>("Days")
 *     .flags()
 *     .member("None", Days::None)
 *     .member("Sunday", Days::Sunday, Description{"First day"});
 * \endcode
 */
template <EnumerationType E>
class EnumDeclaration {
public:
    using enum_type = E;
    using Validator = std::function<bool(E)>;

    explicit EnumDeclaration(std::string typeName)
        : type_name_(std::move(typeName)) {}

    auto flags(bool isFlags = true) -> EnumDeclaration& {
        is_flags_ = isFlags;
        return *this;
    }

    template <typename... Items>
    auto member(std::string name, E value, Items&&... items)
        -> EnumDeclaration& {
        return add(std::move(name), value, false,
                   std::forward<Items>(items)...);
    }

    // Declares the canonical member among several sharing one value.
    template <typename... Items>
    auto primary(std::string name, E value, Items&&... items)
        -> EnumDeclaration& {
        return add(std::move(name), value, true,
                   std::forward<Items>(items)...);
    }

    auto validator(Validator fn) -> EnumDeclaration& {
        validator_ = std::move(fn);
        return *this;
    }

    [[nodiscard]] auto typeName() const noexcept -> std::string_view {
        return type_name_;
    }

    [[nodiscard]] auto isFlags() const noexcept -> bool { return is_flags_; }

    [[nodiscard]] auto members() const noexcept
        -> const std::vector<MemberDeclaration<E>>& {
        return members_;
    }

    [[nodiscard]] auto getValidator() const noexcept -> const Validator& {
        return validator_;
    }

private:
    template <typename... Items>
    auto add(std::string name, E value, bool primary, Items&&... items)
        -> EnumDeclaration& {
        Metadata metadata;
        metadata.reserve(sizeof...(Items));
        (metadata.emplace_back(std::forward<Items>(items)), ...);
        members_.push_back(MemberDeclaration<E>{std::move(name), value,
                                                std::move(metadata), primary});
        return *this;
    }

    std::string type_name_;
    bool is_flags_ = false;
    std::vector<MemberDeclaration<E>> members_;
    Validator validator_;
};

/**
 * @brief Specialize with a static declare() returning EnumDeclaration<T> to
 * make T known to the engine.
 */
template <typename T>
struct EnumTraits;

template <typename T>
concept DeclaredEnum = EnumerationType<T> && requires {
    { EnumTraits<T>::declare() } -> std::convertible_to<EnumDeclaration<T>>;
};

// Specializes EnumTraits at global scope from a declaration expression.
#define ENUMKIT_ENUM_TRAITS(EnumType, ...)                                 \
    template <>                                                            \
    struct enumkit::meta::EnumTraits<EnumType> {                           \
        static auto declare() -> enumkit::meta::EnumDeclaration<EnumType> { \
            return __VA_ARGS__;                                            \
        }                                                                  \
    }

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_TRAITS_HPP
