/*!
 * \file enum_ranges.hpp
 * \brief Lazy, restartable sequences over members and flag bits
 * \author Max Qian <lightapt.com>
 * \date 2024-03-02
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_ENUM_RANGES_HPP
#define ENUMKIT_META_ENUM_RANGES_HPP

#include <cstddef>
#include <iterator>
#include <type_traits>

#include "enumkit/meta/enum_member.hpp"
#include "enumkit/meta/numeric.hpp"

namespace enumkit::meta {

/**
 * @brief Which members a member sequence contains.
 */
enum class EnumMemberSelection {
    // Every declared member, duplicates included.
    All = 0,
    // One member per distinct value, the primary.
    Distinct = 1,
    // Primary members whose value has exactly one bit set.
    Flags = 2,
};

/**
 * @brief View over members of a descriptor in ascending value order.
 *
 * Either walks the member array directly or through an index list; both are
 * owned by the descriptor, which outlives every view.
 */
template <typename E>
class MemberRange {
public:
    using member_type = EnumMember<E>;

    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = member_type;
        using difference_type = std::ptrdiff_t;
        using pointer = const member_type*;
        using reference = const member_type&;

        Iterator() = default;
        Iterator(const member_type* members, const std::size_t* indices,
                 std::size_t pos) noexcept
            : members_(members), indices_(indices), pos_(pos) {}

        auto operator*() const noexcept -> reference {
            return indices_ != nullptr ? members_[indices_[pos_]]
                                       : members_[pos_];
        }

        auto operator->() const noexcept -> pointer { return &**this; }

        auto operator++() noexcept -> Iterator& {
            ++pos_;
            return *this;
        }

        auto operator++(int) noexcept -> Iterator {
            auto temp = *this;
            ++pos_;
            return temp;
        }

        auto operator==(const Iterator& other) const noexcept -> bool {
            return pos_ == other.pos_;
        }

    private:
        const member_type* members_ = nullptr;
        const std::size_t* indices_ = nullptr;
        std::size_t pos_ = 0;
    };

    MemberRange(const member_type* members, const std::size_t* indices,
                std::size_t count) noexcept
        : members_(members), indices_(indices), count_(count) {}

    [[nodiscard]] auto begin() const noexcept -> Iterator {
        return Iterator(members_, indices_, 0);
    }

    [[nodiscard]] auto end() const noexcept -> Iterator {
        return Iterator(members_, indices_, count_);
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return count_; }

    [[nodiscard]] auto empty() const noexcept -> bool { return count_ == 0; }

private:
    const member_type* members_;
    const std::size_t* indices_;
    std::size_t count_;
};

/**
 * @brief The single-bit components of a value, lowest bit first.
 *
 * Every set bit is produced, whether or not a member declares it. Holds only
 * the value, so iterating again starts over.
 */
template <typename E>
class FlagRange {
public:
    using underlying_type = std::underlying_type_t<E>;
    using ops = NumericOps<underlying_type>;
    using bits_type = typename ops::unsigned_type;

    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = E;
        using difference_type = std::ptrdiff_t;
        using pointer = const E*;
        using reference = E;

        Iterator() = default;
        explicit Iterator(bits_type remaining) noexcept
            : remaining_(remaining) {}

        auto operator*() const noexcept -> E {
            return static_cast<E>(ops::lowestBit(ops::fromBits(remaining_)));
        }

        auto operator++() noexcept -> Iterator& {
            remaining_ = static_cast<bits_type>(remaining_ & (remaining_ - 1U));
            return *this;
        }

        auto operator++(int) noexcept -> Iterator {
            auto temp = *this;
            ++*this;
            return temp;
        }

        auto operator==(const Iterator& other) const noexcept -> bool {
            return remaining_ == other.remaining_;
        }

    private:
        bits_type remaining_ = 0;
    };

    explicit FlagRange(E value) noexcept
        : bits_(ops::toBits(static_cast<underlying_type>(value))) {}

    [[nodiscard]] auto begin() const noexcept -> Iterator {
        return Iterator(bits_);
    }

    [[nodiscard]] auto end() const noexcept -> Iterator { return Iterator(0); }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return static_cast<std::size_t>(
            ops::popCount(static_cast<underlying_type>(bits_)));
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return bits_ == 0; }

private:
    bits_type bits_;
};

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_RANGES_HPP
