#pragma once

#include "descriptor_registry.hpp"
#include "../bridge/integral_bridge.hpp"
#include "../codec/symbolic_text_codec.hpp"
#include "../flags/flag_decomposer.hpp"
#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sbr {

// Specialise per enum with:
//   static constexpr std::string_view type_id;
//   static constexpr std::array<std::pair<std::string_view, E>, N> members;  // declaration order
template <typename E>
struct EnumTraits;

template <typename E>
concept DescribedEnum = std::is_enum_v<E> && requires {
    { EnumTraits<E>::type_id } -> std::convertible_to<std::string_view>;
    { EnumTraits<E>::members.size() } -> std::convertible_to<size_t>;
};

// Opt-in bitwise operators for flag enums.
template <typename E>
struct EnableBitmaskOperators : std::false_type {};

template <typename E>
concept BitmaskEnum = std::is_enum_v<E> && EnableBitmaskOperators<E>::value;

// Host enums live outside sbr, so ADL never reaches these. Bring them in with
// `using namespace sbr::bitmask_operators;` at the use site, or with
// using-declarations in the enum's own namespace so ADL finds them everywhere.
namespace bitmask_operators {

template <BitmaskEnum E>
constexpr E operator|(E lhs, E rhs) {
    using U = std::underlying_type_t<E>;
    return static_cast<E>(static_cast<U>(lhs) | static_cast<U>(rhs));
}

template <BitmaskEnum E>
constexpr E operator&(E lhs, E rhs) {
    using U = std::underlying_type_t<E>;
    return static_cast<E>(static_cast<U>(lhs) & static_cast<U>(rhs));
}

template <BitmaskEnum E>
constexpr E operator~(E value) {
    using U = std::underlying_type_t<E>;
    return static_cast<E>(static_cast<U>(~static_cast<U>(value)));
}

template <BitmaskEnum E>
constexpr E& operator|=(E& lhs, E rhs) {
    return lhs = lhs | rhs;
}

} // namespace bitmask_operators

template <typename E>
constexpr IntegralWidth width_of() {
    constexpr size_t bits = sizeof(std::underlying_type_t<E>) * 8;
    static_assert(bits == 8 || bits == 16 || bits == 32 || bits == 64,
                  "unsupported underlying type");
    return static_cast<IntegralWidth>(bits);
}

template <typename E>
constexpr WideInt widen(E value) {
    return static_cast<WideInt>(static_cast<std::underlying_type_t<E>>(value));
}

template <DescribedEnum E>
Result<EnumDescriptor, DescriptorBuildError> build_descriptor() {
    using U = std::underlying_type_t<E>;

    std::vector<EnumMember> members;
    members.reserve(EnumTraits<E>::members.size());
    for (const auto& [name, value] : EnumTraits<E>::members) {
        members.push_back(EnumMember{std::string(name), widen(value)});
    }
    return EnumDescriptor::build(std::string(EnumTraits<E>::type_id), std::move(members),
                                 width_of<E>(), std::is_signed_v<U>);
}

// Typed view over a published descriptor.
template <DescribedEnum E>
class EnumView {
public:
    using underlying_type = std::underlying_type_t<E>;

    explicit EnumView(DescriptorPtr descriptor) : descriptor_(std::move(descriptor)) {}

    const EnumDescriptor& descriptor() const { return *descriptor_; }

    Result<WideInt, IntegralBridgeError> to_integral(E value) const {
        return sbr::to_integral(*descriptor_, widen(value));
    }

    E from_integral(WideInt raw) const {
        return static_cast<E>(static_cast<underlying_type>(sbr::from_integral(*descriptor_, raw)));
    }

    std::optional<E> from_integral_checked(WideInt raw) const {
        auto checked = sbr::from_integral_checked(*descriptor_, raw);
        if (!checked) {
            return std::nullopt;
        }
        return static_cast<E>(static_cast<underlying_type>(*checked));
    }

    std::vector<E> decompose(E value) const {
        std::vector<E> result;
        for (const EnumMember* member : sbr::decompose(*descriptor_, widen(value)).members) {
            result.push_back(static_cast<E>(static_cast<underlying_type>(member->value)));
        }
        return result;
    }

    bool is_exact_union(E value) const { return sbr::is_exact_union(*descriptor_, widen(value)); }
    int count_set_flags(E value) const { return count_set_atomic_bits(*descriptor_, widen(value)); }
    bool has_flag(E value, E flag) const { return sbr::has_flag(*descriptor_, widen(value), widen(flag)); }
    bool is_defined(E value) const { return descriptor_->is_defined(widen(value)); }

    std::string to_string(E value, FormatStyle style = FormatStyle::General) const {
        return format(*descriptor_, widen(value), style);
    }

    Result<E, ParseError> parse(std::string_view text, bool case_sensitive = false) const {
        auto parsed = sbr::parse(*descriptor_, text, case_sensitive);
        if (!parsed) {
            return parsed.error();
        }
        return static_cast<E>(static_cast<underlying_type>(parsed.value()));
    }

    std::vector<E> values() const {
        std::vector<E> result;
        result.reserve(descriptor_->size());
        for (const auto& member : descriptor_->members()) {
            result.push_back(static_cast<E>(static_cast<underlying_type>(member.value)));
        }
        return result;
    }

private:
    DescriptorPtr descriptor_;
};

// Builds E's descriptor through the registry on first use.
template <DescribedEnum E>
Result<EnumView<E>, DescriptorBuildError> view_of(DescriptorRegistry& registry) {
    auto descriptor = registry.get_or_build(EnumTraits<E>::type_id, [] {
        return build_descriptor<E>();
    });
    if (!descriptor) {
        return descriptor.error();
    }
    return EnumView<E>(descriptor.value());
}

} // namespace sbr
