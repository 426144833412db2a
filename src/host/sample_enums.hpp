#pragma once

#include "../descriptor/enum_traits.hpp"
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace sbr::samples {

enum class Priority : int32_t { Low = 1, Medium = 2, High = 3, Critical = 4 };

enum class BorderSides : int32_t {
    None = 0,
    Left = 1,
    Right = 2,
    Top = 4,
    Bottom = 8,
    LeftRight = Left | Right,
    TopBottom = Top | Bottom,
    All = Left | Right | Top | Bottom
};

enum class FileSize : int64_t {
    Empty = 0,
    Small = 1024LL,
    Medium = 1048576LL,
    Large = 1073741824LL,
    Huge = 1099511627776LL
};

enum class DaysOfWeek : int32_t {
    None = 0,
    Monday = 1,
    Tuesday = 2,
    Wednesday = 4,
    Thursday = 8,
    Friday = 16,
    Saturday = 32,
    Sunday = 64,
    Weekdays = Monday | Tuesday | Wednesday | Thursday | Friday,
    Weekend = Saturday | Sunday,
    All = Weekdays | Weekend
};

enum class FilePermissions : uint8_t { None = 0, Read = 1, Write = 2, Execute = 4, Delete = 8 };

enum class HttpStatusCode : uint16_t {
    OK = 200,
    Created = 201,
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    InternalServerError = 500
};

enum class FeatureFlags : uint64_t {
    None = 0,
    DarkMode = 1,
    ExperimentalUI = 2,
    AdvancedReporting = 4,
    BetaFeatures = 8,
    DebugMode = 16,
    StandardUser = DarkMode,
    PowerUser = DarkMode | AdvancedReporting,
    Developer = DarkMode | ExperimentalUI | BetaFeatures | DebugMode,
    All = DarkMode | ExperimentalUI | AdvancedReporting | BetaFeatures | DebugMode
};

using bitmask_operators::operator|;
using bitmask_operators::operator&;
using bitmask_operators::operator~;
using bitmask_operators::operator|=;

} // namespace sbr::samples

namespace sbr {

template <> struct EnableBitmaskOperators<samples::BorderSides> : std::true_type {};
template <> struct EnableBitmaskOperators<samples::DaysOfWeek> : std::true_type {};
template <> struct EnableBitmaskOperators<samples::FilePermissions> : std::true_type {};
template <> struct EnableBitmaskOperators<samples::FeatureFlags> : std::true_type {};

template <>
struct EnumTraits<samples::Priority> {
    using E = samples::Priority;
    static constexpr std::string_view type_id = "Priority";
    static constexpr std::array<std::pair<std::string_view, E>, 4> members{{
        {"Low", E::Low}, {"Medium", E::Medium}, {"High", E::High}, {"Critical", E::Critical}
    }};
};

template <>
struct EnumTraits<samples::BorderSides> {
    using E = samples::BorderSides;
    static constexpr std::string_view type_id = "BorderSides";
    static constexpr std::array<std::pair<std::string_view, E>, 8> members{{
        {"None", E::None}, {"Left", E::Left}, {"Right", E::Right}, {"Top", E::Top},
        {"Bottom", E::Bottom}, {"LeftRight", E::LeftRight}, {"TopBottom", E::TopBottom},
        {"All", E::All}
    }};
};

template <>
struct EnumTraits<samples::FileSize> {
    using E = samples::FileSize;
    static constexpr std::string_view type_id = "FileSize";
    static constexpr std::array<std::pair<std::string_view, E>, 5> members{{
        {"Empty", E::Empty}, {"Small", E::Small}, {"Medium", E::Medium},
        {"Large", E::Large}, {"Huge", E::Huge}
    }};
};

template <>
struct EnumTraits<samples::DaysOfWeek> {
    using E = samples::DaysOfWeek;
    static constexpr std::string_view type_id = "DaysOfWeek";
    static constexpr std::array<std::pair<std::string_view, E>, 11> members{{
        {"None", E::None}, {"Monday", E::Monday}, {"Tuesday", E::Tuesday},
        {"Wednesday", E::Wednesday}, {"Thursday", E::Thursday}, {"Friday", E::Friday},
        {"Saturday", E::Saturday}, {"Sunday", E::Sunday}, {"Weekdays", E::Weekdays},
        {"Weekend", E::Weekend}, {"All", E::All}
    }};
};

template <>
struct EnumTraits<samples::FilePermissions> {
    using E = samples::FilePermissions;
    static constexpr std::string_view type_id = "FilePermissions";
    static constexpr std::array<std::pair<std::string_view, E>, 5> members{{
        {"None", E::None}, {"Read", E::Read}, {"Write", E::Write},
        {"Execute", E::Execute}, {"Delete", E::Delete}
    }};
};

template <>
struct EnumTraits<samples::HttpStatusCode> {
    using E = samples::HttpStatusCode;
    static constexpr std::string_view type_id = "HttpStatusCode";
    static constexpr std::array<std::pair<std::string_view, E>, 7> members{{
        {"OK", E::OK}, {"Created", E::Created}, {"BadRequest", E::BadRequest},
        {"Unauthorized", E::Unauthorized}, {"Forbidden", E::Forbidden},
        {"NotFound", E::NotFound}, {"InternalServerError", E::InternalServerError}
    }};
};

template <>
struct EnumTraits<samples::FeatureFlags> {
    using E = samples::FeatureFlags;
    static constexpr std::string_view type_id = "FeatureFlags";
    static constexpr std::array<std::pair<std::string_view, E>, 10> members{{
        {"None", E::None}, {"DarkMode", E::DarkMode}, {"ExperimentalUI", E::ExperimentalUI},
        {"AdvancedReporting", E::AdvancedReporting}, {"BetaFeatures", E::BetaFeatures},
        {"DebugMode", E::DebugMode}, {"StandardUser", E::StandardUser},
        {"PowerUser", E::PowerUser}, {"Developer", E::Developer}, {"All", E::All}
    }};
};

} // namespace sbr
