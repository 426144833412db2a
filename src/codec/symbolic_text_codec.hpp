#pragma once

#include "../descriptor/enum_descriptor.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace sbr {

enum class FormatStyle : uint8_t {
    General,  // 'G': declared name, else atomic names, else decimal
    Flags,    // 'F': atomic names even when a composite alias matches
    Decimal,  // 'D'
    Hex       // 'X': zero-padded to the declared width
};

inline constexpr std::string_view MEMBER_SEPARATOR = ", ";

std::optional<FormatStyle> parse_format_style(std::string_view letter);

// Never fails; values that match no name combination, or do not fit the
// declared width, fall back to decimal.
std::string format(const EnumDescriptor& descriptor, WideInt raw,
                   FormatStyle style = FormatStyle::General);

// Parses a comma-separated list of member names (or decimal literals) and ORs
// their values together. Tokens are trimmed; case_sensitive applies to every
// token of the call.
Result<WideInt, ParseError> parse(const EnumDescriptor& descriptor, std::string_view text,
                                  bool case_sensitive = false);

} // namespace sbr
