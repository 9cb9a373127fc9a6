/*!
 * \file enum_descriptor.hpp
 * \brief Per-enumeration metadata cache, flag algebra and format/parse
 * pipeline
 * \author Max Qian <lightapt.com>
 * \date 2024-03-02
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_ENUM_DESCRIPTOR_HPP
#define ENUMKIT_META_ENUM_DESCRIPTOR_HPP

#include <algorithm>
#include <atomic>
#include <concepts>
#include <cstddef>
#include <memory>
#include <numeric>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <spdlog/spdlog.h>

#include "enumkit/error/exception.hpp"
#include "enumkit/meta/enum_config.hpp"
#include "enumkit/meta/enum_format.hpp"
#include "enumkit/meta/enum_member.hpp"
#include "enumkit/meta/enum_ranges.hpp"
#include "enumkit/meta/enum_traits.hpp"
#include "enumkit/meta/enum_validation.hpp"
#include "enumkit/meta/numeric.hpp"
#include "enumkit/utils/string.hpp"

namespace enumkit::meta {

/**
 * @brief Immutable metadata of one enumeration.
 *
 * Members are kept sorted by value (declaration order among equal values) so
 * value lookups are binary searches; names are hashed. The primary member of
 * every distinct value is resolved here, once, and never recomputed. Apart
 * from the lazily built case-insensitive name index, which is published with
 * a compare-and-swap, nothing changes after construction, so a descriptor is
 * shared across threads without locking.
 *
 * @tparam E The enumeration type.
 */
template <EnumerationType E>
class EnumDescriptor {
public:
    using enum_type = E;
    using underlying_type = std::underlying_type_t<E>;
    using ops = NumericOps<underlying_type>;
    using member_type = EnumMember<E>;
    using Validator = typename EnumDeclaration<E>::Validator;

    explicit EnumDescriptor(const EnumDeclaration<E>& declaration)
        : type_name_(declaration.typeName()),
          is_flags_(declaration.isFlags()),
          validator_(declaration.getValidator()) {
        build(declaration.members());
        spdlog::debug(
            "Built enum descriptor for {}: {} members, {} distinct, flags: {}",
            type_name_, members_.size(), primaries_.size(), is_flags_);
    }

    ~EnumDescriptor() { delete ignore_case_index_.load(); }

    EnumDescriptor(const EnumDescriptor&) = delete;
    auto operator=(const EnumDescriptor&) -> EnumDescriptor& = delete;

    // Type information

    [[nodiscard]] auto typeName() const noexcept -> std::string_view {
        return type_name_;
    }

    [[nodiscard]] auto isFlagEnum() const noexcept -> bool { return is_flags_; }

    [[nodiscard]] auto allFlags() const noexcept -> E { return all_flags_; }

    // Distinct values form an unbroken range.
    [[nodiscard]] auto isContiguous() const noexcept -> bool {
        return is_contiguous_;
    }

    [[nodiscard]] auto minDefined() const noexcept -> std::optional<E> {
        if (members_.empty()) {
            return std::nullopt;
        }
        return members_.front().value();
    }

    [[nodiscard]] auto maxDefined() const noexcept -> std::optional<E> {
        if (members_.empty()) {
            return std::nullopt;
        }
        return members_.back().value();
    }

    [[nodiscard]] auto hasCustomValidator() const noexcept -> bool {
        return static_cast<bool>(validator_);
    }

    [[nodiscard]] auto memberCount(
        EnumMemberSelection selection = EnumMemberSelection::All) const noexcept
        -> std::size_t {
        return members(selection).size();
    }

    /**
     * @brief Members in ascending value order.
     *
     * @param selection All declared members, one per distinct value, or the
     * single-bit ones.
     */
    [[nodiscard]] auto members(
        EnumMemberSelection selection = EnumMemberSelection::All) const noexcept
        -> MemberRange<E> {
        switch (selection) {
            case EnumMemberSelection::Distinct:
                return {members_.data(), primaries_.data(), primaries_.size()};
            case EnumMemberSelection::Flags:
                return {members_.data(), flags_.data(), flags_.size()};
            case EnumMemberSelection::All:
                break;
        }
        return {members_.data(), nullptr, members_.size()};
    }

    [[nodiscard]] auto names(
        EnumMemberSelection selection = EnumMemberSelection::All) const
        -> std::vector<std::string_view> {
        std::vector<std::string_view> result;
        result.reserve(memberCount(selection));
        for (const auto& member : members(selection)) {
            result.push_back(member.name());
        }
        return result;
    }

    // Lookup

    /**
     * @brief Finds the primary member declared with value.
     *
     * @return The member, nullptr if value is not declared.
     */
    [[nodiscard]] auto getMember(E value) const noexcept -> const member_type* {
        const auto raw = toRaw(value);
        auto it = std::lower_bound(
            primaries_.begin(), primaries_.end(), raw,
            [this](std::size_t index, underlying_type target) {
                return members_[index].underlying() < target;
            });
        if (it == primaries_.end() || members_[*it].underlying() != raw) {
            return nullptr;
        }
        return &members_[*it];
    }

    /**
     * @brief Finds a member by its declared name.
     *
     * An exact match always wins; with ignoreCase the case-insensitive index
     * is consulted next and built on first use.
     *
     * @return The member, nullptr if no member has that name.
     */
    [[nodiscard]] auto getMember(std::string_view name,
                                 bool ignoreCase = false) const
        -> const member_type* {
        if (auto it = name_index_.find(name); it != name_index_.end()) {
            return &members_[it->second];
        }
        if (ignoreCase) {
            const auto& index = ignoreCaseIndex();
            if (auto it = index.find(name); it != index.end()) {
                return &members_[it->second];
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto isDefined(E value) const noexcept -> bool {
        if (is_contiguous_) {
            const auto raw = toRaw(value);
            return members_.front().underlying() <= raw &&
                   raw <= members_.back().underlying();
        }
        return getMember(value) != nullptr;
    }

    // Validation

    [[nodiscard]] auto isValid(
        E value, EnumValidation validation = EnumValidation::Default) const
        -> bool {
        switch (validation) {
            case EnumValidation::None:
                return true;
            case EnumValidation::IsDefined:
                return isDefined(value);
            case EnumValidation::IsValidFlagCombination:
                return isValidFlagCombination(value);
            case EnumValidation::Default:
                break;
        }
        if (validator_ && validator_(value)) {
            return true;
        }
        if (is_flags_ && isValidFlagCombination(value)) {
            return true;
        }
        return isDefined(value);
    }

    /**
     * @brief Returns value unchanged if it is valid.
     *
     * @throws error::InvalidArgument If value fails the validation.
     */
    auto validate(E value,
                  EnumValidation validation = EnumValidation::Default) const
        -> E {
        if (!isValid(value, validation)) {
            THROW_INVALID_ARGUMENT("Invalid value ", asString(value), " for ",
                                   type_name_);
        }
        return value;
    }

    /**
     * @brief Converts a wide integer into E.
     *
     * @throws error::OverflowError If value does not fit the underlying type.
     * @throws error::InvalidArgument If value fails the validation.
     */
    template <typename I>
        requires std::same_as<I, std::int64_t> || std::same_as<I, std::uint64_t>
    auto toObject(I value,
                  EnumValidation validation = EnumValidation::None) const -> E {
        if (!ops::isInValueRange(value)) {
            THROW_OVERFLOW_ERROR("Value ", value,
                                 " is outside the underlying range of ",
                                 type_name_);
        }
        return validate(fromRaw(static_cast<underlying_type>(value)),
                        validation);
    }

    template <typename I>
        requires std::same_as<I, std::int64_t> || std::same_as<I, std::uint64_t>
    [[nodiscard]] auto tryToObject(
        I value, EnumValidation validation = EnumValidation::None) const
        -> std::optional<E> {
        if (!ops::isInValueRange(value)) {
            return std::nullopt;
        }
        const auto result = fromRaw(static_cast<underlying_type>(value));
        if (!isValid(result, validation)) {
            return std::nullopt;
        }
        return result;
    }

    // Flag algebra. Pure functions of their arguments and allFlags().

    // Every set bit is also set in allFlags(); zero always qualifies.
    [[nodiscard]] auto isValidFlagCombination(E value) const noexcept -> bool {
        return ops::bitAnd(toRaw(value), ops::bitNot(toRaw(all_flags_))) ==
               ops::zero;
    }

    // Ignores bits outside allFlags().
    [[nodiscard]] auto hasAnyFlags(E value) const noexcept -> bool {
        return hasAnyFlags(value, all_flags_);
    }

    [[nodiscard]] static auto hasAnyFlags(E value, E flags) noexcept -> bool {
        return ops::bitAnd(toRaw(value), toRaw(flags)) != ops::zero;
    }

    [[nodiscard]] auto hasAllFlags(E value) const noexcept -> bool {
        return hasAllFlags(value, all_flags_);
    }

    [[nodiscard]] static auto hasAllFlags(E value, E flags) noexcept -> bool {
        return ops::bitAnd(toRaw(value), toRaw(flags)) == toRaw(flags);
    }

    /**
     * @brief Complements value within allFlags().
     *
     * Bits outside allFlags() are kept as they are; none are introduced.
     */
    [[nodiscard]] auto toggleFlags(E value) const noexcept -> E {
        return toggleFlags(value, all_flags_);
    }

    [[nodiscard]] static auto toggleFlags(E value, E flags) noexcept -> E {
        return fromRaw(ops::bitXor(toRaw(value), toRaw(flags)));
    }

    [[nodiscard]] static auto commonFlags(E value, E flags) noexcept -> E {
        return fromRaw(ops::bitAnd(toRaw(value), toRaw(flags)));
    }

    // Folds left to right.
    template <typename... Rest>
        requires(std::same_as<Rest, E> && ...)
    [[nodiscard]] static auto combineFlags(E first, Rest... rest) noexcept
        -> E {
        auto result = toRaw(first);
        ((result = ops::bitOr(result, toRaw(rest))), ...);
        return fromRaw(result);
    }

    [[nodiscard]] static auto removeFlags(E value, E flags) noexcept -> E {
        return fromRaw(ops::bitAnd(toRaw(value), ops::bitNot(toRaw(flags))));
    }

    // Single-bit components of value by increasing significance, named or not.
    [[nodiscard]] static auto getFlags(E value) noexcept -> FlagRange<E> {
        return FlagRange<E>(value);
    }

    [[nodiscard]] static auto getFlagCount(E value) noexcept -> int {
        return ops::popCount(toRaw(value));
    }

    // Members of the named flags in value; unnamed bits are skipped.
    [[nodiscard]] auto getFlagMembers(E value) const
        -> std::vector<const member_type*> {
        std::vector<const member_type*> result;
        for (const auto flag : getFlags(value)) {
            if (const auto* member = getMember(flag)) {
                result.push_back(member);
            }
        }
        return result;
    }

    // Formatting

    /**
     * @brief Default rendering: the name, else for flag enums the joined flag
     * names, else the decimal value. Never empty.
     */
    [[nodiscard]] auto asString(E value) const -> std::string {
        static constexpr EnumFormat kDefault[] = {EnumFormat::Name,
                                                  EnumFormat::DecimalValue};
        std::optional<std::string> result;
        if (is_flags_) {
            result = formatFlags(value, EnumConfig::default_flag_delimiter,
                                 kDefault);
        } else {
            result = format(value, kDefault);
        }
        return result ? std::move(*result) : ops::toDecimalString(toRaw(value));
    }

    /**
     * @brief Renders value with the first format in the order that produces
     * text.
     *
     * @return The text, or nullopt when every format falls through.
     * @throws error::InvalidArgument If formats is empty or holds an
     * identifier unknown to registry.
     */
    [[nodiscard]] auto format(
        E value, const FormatOrder& formats,
        const FormatRegistry& registry = FormatRegistry::global()) const
        -> std::optional<std::string> {
        requireFormats(formats);
        const member_type* member = nullptr;
        bool resolved = false;
        for (const auto format : formats) {
            if (auto text =
                    formatOne(value, format, member, resolved, registry)) {
                return text;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Renders a flag combination.
     *
     * A declared value, zero, or a value with undeclared bits is rendered as
     * a whole; any other combination is rendered flag by flag, lowest first,
     * joined with delimiter. Fails as a whole when one flag has no text.
     */
    [[nodiscard]] auto formatFlags(
        E value, std::string_view delimiter, const FormatOrder& formats,
        const FormatRegistry& registry = FormatRegistry::global()) const
        -> std::optional<std::string> {
        requireFormats(formats);
        if (getMember(value) != nullptr || toRaw(value) == ops::zero ||
            !isValidFlagCombination(value)) {
            return format(value, formats, registry);
        }
        if (delimiter.empty()) {
            delimiter = EnumConfig::default_flag_delimiter;
        }

        std::string result;
        for (const auto flag : getFlags(value)) {
            auto text = format(flag, formats, registry);
            if (!text) {
                return std::nullopt;
            }
            if (!result.empty()) {
                result += delimiter;
            }
            result += *text;
        }
        return result;
    }

    [[nodiscard]] auto formatFlags(E value, std::string_view delimiter =
                                                EnumConfig::default_flag_delimiter)
        const -> std::string {
        static constexpr EnumFormat kDefault[] = {EnumFormat::Name,
                                                  EnumFormat::DecimalValue};
        auto result = formatFlags(value, delimiter, kDefault);
        return result ? std::move(*result) : ops::toDecimalString(toRaw(value));
    }

    // Parsing

    /**
     * @brief Resolves text under the formats in order.
     *
     * Surrounding whitespace is ignored. For flag enums, text that resolves
     * as a whole under no format but contains the flag delimiter is parsed as
     * a flag list.
     *
     * @throws error::OverflowError If text is a numeric literal outside the
     * underlying range.
     * @throws error::ParseError If text resolves under no format.
     * @throws error::InvalidArgument If formats is empty or unknown.
     */
    auto parse(std::string_view text, bool ignoreCase,
               const FormatOrder& formats,
               const FormatRegistry& registry = FormatRegistry::global()) const
        -> E {
        ParseFailure failure;
        if (auto result = parseCore(text, ignoreCase, formats, registry,
                                    failure)) {
            return *result;
        }
        raise(text, formats, failure);
    }

    auto parse(std::string_view text, bool ignoreCase = false) const -> E {
        return parse(text, ignoreCase, defaultFormats());
    }

    [[nodiscard]] auto tryParse(
        std::string_view text, bool ignoreCase, const FormatOrder& formats,
        const FormatRegistry& registry = FormatRegistry::global()) const
        -> std::optional<E> {
        ParseFailure failure;
        return parseCore(text, ignoreCase, formats, registry, failure);
    }

    [[nodiscard]] auto tryParse(std::string_view text,
                                bool ignoreCase = false) const
        -> std::optional<E> {
        return tryParse(text, ignoreCase, defaultFormats());
    }

    /**
     * @brief Like parse, but the result must be a declared member.
     *
     * @throws error::ParseError If text resolves to an undeclared value.
     */
    auto parseMember(std::string_view text, bool ignoreCase,
                     const FormatOrder& formats,
                     const FormatRegistry& registry =
                         FormatRegistry::global()) const -> const member_type& {
        const auto value = parse(text, ignoreCase, formats, registry);
        if (const auto* member = getMember(value)) {
            return *member;
        }
        THROW_PARSE_ERROR(text, formats, "'", text,
                          "' is not a declared member of ", type_name_);
    }

    /**
     * @brief Splits text on delimiter and ORs together what every token
     * resolves to.
     *
     * Tokens are trimmed. An empty delimiter means ","; a delimiter with
     * surrounding whitespace is matched without it.
     *
     * @throws error::ParseError If a token resolves to nothing.
     * @throws error::OverflowError If a token is an out of range literal.
     */
    auto parseFlags(std::string_view text, bool ignoreCase,
                    std::string_view delimiter, const FormatOrder& formats,
                    const FormatRegistry& registry =
                        FormatRegistry::global()) const -> E {
        ParseFailure failure;
        if (auto result = parseFlagsCore(text, ignoreCase, delimiter, formats,
                                         registry, failure)) {
            return *result;
        }
        raise(text, formats, failure);
    }

    auto parseFlags(std::string_view text, bool ignoreCase = false,
                    std::string_view delimiter = {}) const -> E {
        return parseFlags(text, ignoreCase, delimiter, defaultFormats());
    }

    [[nodiscard]] auto tryParseFlags(
        std::string_view text, bool ignoreCase, std::string_view delimiter,
        const FormatOrder& formats,
        const FormatRegistry& registry = FormatRegistry::global()) const
        -> std::optional<E> {
        ParseFailure failure;
        return parseFlagsCore(text, ignoreCase, delimiter, formats, registry,
                              failure);
    }

private:
    using NameIndex = std::unordered_map<std::string_view, std::size_t>;
    using IgnoreCaseIndex =
        std::unordered_map<std::string_view, std::size_t,
                           utils::CaseInsensitiveHash,
                           utils::CaseInsensitiveEqual>;

    enum class FailureKind { None, Empty, NotFound, Overflow };

    struct ParseFailure {
        FailureKind kind = FailureKind::None;
        std::string_view token;
    };

    static constexpr auto toRaw(E value) noexcept -> underlying_type {
        return static_cast<underlying_type>(value);
    }

    static constexpr auto fromRaw(underlying_type value) noexcept -> E {
        return static_cast<E>(value);
    }

    static auto defaultFormats() -> FormatOrder {
        static constexpr EnumFormat kDefault[] = {EnumFormat::Name,
                                                  EnumFormat::DecimalValue};
        return FormatOrder(kDefault);
    }

    static void requireFormats(const FormatOrder& formats) {
        if (formats.empty()) {
            THROW_INVALID_ARGUMENT("Format order must not be empty");
        }
    }

    void build(const std::vector<MemberDeclaration<E>>& declared) {
        std::unordered_set<std::string_view> seen;
        for (const auto& decl : declared) {
            if (!seen.insert(decl.name).second) {
                spdlog::error("Enum {} declares member {} twice", type_name_,
                              decl.name);
                THROW_INVALID_ARGUMENT("Duplicate member name ", decl.name,
                                       " in ", type_name_);
            }
        }

        std::vector<std::size_t> order(declared.size());
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(),
                         [&declared](std::size_t lhs, std::size_t rhs) {
                             return static_cast<underlying_type>(
                                        declared[lhs].value) <
                                    static_cast<underlying_type>(
                                        declared[rhs].value);
                         });

        members_.reserve(declared.size());
        auto allFlags = ops::zero;
        for (std::size_t runStart = 0; runStart < order.size();) {
            const auto raw = toRaw(declared[order[runStart]].value);
            auto runEnd = runStart;
            std::size_t primary = runStart;
            std::size_t marked = 0;
            for (; runEnd < order.size() &&
                   toRaw(declared[order[runEnd]].value) == raw;
                 ++runEnd) {
                if (declared[order[runEnd]].primary && marked++ == 0) {
                    primary = runEnd;
                }
            }
            if (marked > 1) {
                spdlog::error("Enum {} marks {} primaries for value {}",
                              type_name_, marked, ops::toDecimalString(raw));
                THROW_INVALID_ARGUMENT("More than one primary member for value ",
                                       ops::toDecimalString(raw), " in ",
                                       type_name_);
            }

            for (auto pos = runStart; pos < runEnd; ++pos) {
                const auto& decl = declared[order[pos]];
                if (pos == primary) {
                    primaries_.push_back(members_.size());
                    if (ops::hasSingleBit(raw)) {
                        flags_.push_back(members_.size());
                        allFlags = ops::bitOr(allFlags, raw);
                    }
                }
                members_.emplace_back(decl.value, decl.name, decl.metadata,
                                      pos == primary);
            }
            runStart = runEnd;
        }
        all_flags_ = fromRaw(allFlags);

        // members_ is final, so views into the names stay valid
        name_index_.reserve(members_.size());
        for (std::size_t i = 0; i < members_.size(); ++i) {
            name_index_.emplace(members_[i].name(), i);
        }

        if (!primaries_.empty()) {
            const auto span = static_cast<typename ops::unsigned_type>(
                ops::toBits(members_.back().underlying()) -
                ops::toBits(members_.front().underlying()));
            is_contiguous_ =
                static_cast<std::uint64_t>(span) == primaries_.size() - 1;
        }
    }

    auto ignoreCaseIndex() const -> const IgnoreCaseIndex& {
        if (const auto* index =
                ignore_case_index_.load(std::memory_order_acquire)) {
            return *index;
        }

        // Concurrent first users may all build; the first to publish wins and
        // the others discard their equal copy.
        auto built = std::make_unique<IgnoreCaseIndex>();
        built->reserve(members_.size());
        for (std::size_t i = 0; i < members_.size(); ++i) {
            built->emplace(members_[i].name(), i);
        }
        const IgnoreCaseIndex* expected = nullptr;
        if (ignore_case_index_.compare_exchange_strong(
                expected, built.get(), std::memory_order_acq_rel,
                std::memory_order_acquire)) {
            spdlog::debug("Built case-insensitive name index for {}",
                          type_name_);
            return *built.release();
        }
        return *expected;
    }

    auto formatOne(E value, EnumFormat format, const member_type*& member,
                   bool& resolved, const FormatRegistry& registry) const
        -> std::optional<std::string> {
        switch (format) {
            case EnumFormat::DecimalValue:
            case EnumFormat::UnderlyingValue:
                return ops::toDecimalString(toRaw(value));
            case EnumFormat::HexadecimalValue:
                return ops::toHexString(toRaw(value));
            default:
                break;
        }

        const CustomFormatter* custom = nullptr;
        if (!isBuiltinFormat(format)) {
            custom = &registry.resolve(format);
        }
        if (!resolved) {
            member = getMember(value);
            resolved = true;
        }
        if (member == nullptr) {
            return std::nullopt;
        }

        if (format == EnumFormat::Name) {
            return std::string(member->name());
        }
        if (format == EnumFormat::Description) {
            if (auto desc = member->description()) {
                return std::string(*desc);
            }
            return std::nullopt;
        }
        auto text = (*custom)(*member);
        if (text.empty()) {
            return std::nullopt;
        }
        return text;
    }

    // Resolves one already trimmed token, without the flag list fallback.
    auto parseToken(std::string_view text, bool ignoreCase,
                    const FormatOrder& formats, const FormatRegistry& registry,
                    bool& overflow) const
        -> std::optional<E> {
        for (const auto format : formats) {
            switch (format) {
                case EnumFormat::DecimalValue:
                case EnumFormat::UnderlyingValue:
                case EnumFormat::HexadecimalValue: {
                    const auto parsed = format == EnumFormat::HexadecimalValue
                                            ? ops::parseHex(text)
                                            : ops::parseDecimal(text);
                    if (parsed.ok()) {
                        return fromRaw(parsed.value);
                    }
                    overflow = overflow ||
                               parsed.status == NumericParseStatus::Overflow;
                    break;
                }
                case EnumFormat::Name:
                    if (const auto* member = getMember(text, ignoreCase)) {
                        return member->value();
                    }
                    break;
                case EnumFormat::Description:
                    for (const auto& member : members_) {
                        auto desc = member.description();
                        if (desc && (ignoreCase ? utils::iequals(*desc, text)
                                                : *desc == text)) {
                            return member.value();
                        }
                    }
                    break;
                default: {
                    const auto& formatter = registry.resolve(format);
                    for (const auto& member : members_) {
                        const auto rendered = formatter(member);
                        if (!rendered.empty() && rendered == text) {
                            return member.value();
                        }
                    }
                    break;
                }
            }
        }
        return std::nullopt;
    }

    auto parseCore(std::string_view text, bool ignoreCase,
                   const FormatOrder& formats, const FormatRegistry& registry,
                   ParseFailure& failure) const
        -> std::optional<E> {
        requireFormats(formats);
        const auto trimmed = utils::trim(text);
        if (trimmed.empty()) {
            failure = {FailureKind::Empty, trimmed};
            return std::nullopt;
        }

        bool overflow = false;
        if (auto result =
                parseToken(trimmed, ignoreCase, formats, registry, overflow)) {
            return result;
        }
        if (is_flags_ && trimmed.find(EnumConfig::flag_parse_delimiter) !=
                             std::string_view::npos) {
            return parseFlagsCore(trimmed, ignoreCase, {}, formats, registry,
                                  failure);
        }
        failure = {overflow ? FailureKind::Overflow : FailureKind::NotFound,
                   trimmed};
        return std::nullopt;
    }

    auto parseFlagsCore(std::string_view text, bool ignoreCase,
                        std::string_view delimiter, const FormatOrder& formats,
                        const FormatRegistry& registry,
                        ParseFailure& failure) const -> std::optional<E> {
        requireFormats(formats);
        if (delimiter.empty()) {
            delimiter = EnumConfig::flag_parse_delimiter;
        } else if (const auto effective = utils::trim(delimiter);
                   !effective.empty()) {
            delimiter = effective;
        }

        text = utils::trim(text);
        if (text.empty()) {
            failure = {FailureKind::Empty, text};
            return std::nullopt;
        }

        auto result = ops::zero;
        std::size_t start = 0;
        while (start < text.size()) {
            start = text.find_first_not_of(" \t\n\v\f\r", start);
            if (start == std::string_view::npos) {
                break;
            }
            auto end = text.find(delimiter, start);
            if (end == std::string_view::npos) {
                end = text.size();
            }
            const auto token = utils::trim(text.substr(start, end - start));
            bool overflow = false;
            const auto value =
                parseToken(token, ignoreCase, formats, registry, overflow);
            if (!value) {
                failure = {
                    overflow ? FailureKind::Overflow : FailureKind::NotFound,
                    token};
                return std::nullopt;
            }
            result = ops::bitOr(result, toRaw(*value));
            start = end + delimiter.size();
        }
        return fromRaw(result);
    }

    [[noreturn]] void raise(std::string_view text, const FormatOrder& formats,
                            const ParseFailure& failure) const {
        switch (failure.kind) {
            case FailureKind::Overflow:
                THROW_OVERFLOW_ERROR("'", failure.token,
                                     "' is outside the underlying range of ",
                                     type_name_);
            case FailureKind::Empty:
                THROW_PARSE_ERROR(text, formats,
                                  "Empty text is not a value of ", type_name_);
            case FailureKind::NotFound:
            case FailureKind::None:
                break;
        }
        THROW_PARSE_ERROR(text, formats, "'", failure.token,
                          "' is not recognized as ", type_name_,
                          " under formats [", describeFormats(formats.span()),
                          "]");
    }

    std::string type_name_;
    bool is_flags_;
    Validator validator_;

    // Sorted by value, declaration order among equal values
    std::vector<member_type> members_;
    // Indices into members_ of the primary of each distinct value
    std::vector<std::size_t> primaries_;
    // Indices of primaries whose value has exactly one bit set
    std::vector<std::size_t> flags_;
    NameIndex name_index_;
    mutable std::atomic<const IgnoreCaseIndex*> ignore_case_index_{nullptr};
    E all_flags_{};
    bool is_contiguous_ = false;
};

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_ENUM_DESCRIPTOR_HPP
