#include "errors.hpp"

namespace sbr {

std::string to_string(const DescriptorBuildError& error) {
    switch (error.kind) {
        case DescriptorBuildError::Kind::EmptyMembers:
            return "enum '" + error.type_id + "' declares no members";
        case DescriptorBuildError::Kind::DuplicateName:
            return "enum '" + error.type_id + "' declares member '" + error.member + "' twice";
        case DescriptorBuildError::Kind::ValueOutOfRange:
            return "enum '" + error.type_id + "' member '" + error.member +
                   "' does not fit the underlying width";
    }
    return "unknown descriptor build error";
}

std::string to_string(const IntegralBridgeError& error) {
    switch (error.kind) {
        case IntegralBridgeError::Kind::Overflow:
            return "value " + to_decimal(error.value) + " overflows the underlying width";
    }
    return "unknown integral bridge error";
}

std::string to_string(const ParseError& error) {
    switch (error.kind) {
        case ParseError::Kind::EmptyInput:
            return "input is empty";
        case ParseError::Kind::UnknownMember:
            return "'" + error.token + "' is not a declared member";
        case ParseError::Kind::ValueOutOfRange:
            return "'" + error.token + "' does not fit the underlying width";
    }
    return "unknown parse error";
}

} // namespace sbr
