#pragma once

#include "wide_int.hpp"
#include <string>

namespace sbr {

struct DescriptorBuildError {
    enum class Kind : uint8_t {
        EmptyMembers,
        DuplicateName,
        ValueOutOfRange
    };

    Kind kind;
    std::string type_id;
    std::string member;  // offending member, empty for EmptyMembers
};

struct IntegralBridgeError {
    enum class Kind : uint8_t { Overflow };

    Kind kind;
    WideInt value;
};

struct ParseError {
    enum class Kind : uint8_t {
        EmptyInput,
        UnknownMember,
        ValueOutOfRange
    };

    Kind kind;
    std::string token;
};

std::string to_string(const DescriptorBuildError& error);
std::string to_string(const IntegralBridgeError& error);
std::string to_string(const ParseError& error);

} // namespace sbr
