#include "symbolic_text_codec.hpp"
#include "../bridge/integral_bridge.hpp"
#include "../flags/flag_decomposer.hpp"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <vector>

namespace sbr {

namespace {

std::string join_names(const Decomposition& decomposition) {
    std::string result;
    for (const EnumMember* member : decomposition.members) {
        if (!result.empty()) {
            result += MEMBER_SEPARATOR;
        }
        result += member->name;
    }
    return result;
}

std::string format_names(const EnumDescriptor& descriptor, WideInt value, bool collapse_aliases) {
    const auto atomics = atomic_members(descriptor);

    // Plain (non-flag) enums always resolve to the declared name.
    if (collapse_aliases || value == 0 || atomics.empty()) {
        if (const EnumMember* member = descriptor.find_by_value(value)) {
            return member->name;
        }
    }

    if (value != 0 && !atomics.empty()) {
        Decomposition decomposition = decompose(descriptor, value);
        if (decomposition.exact() && !decomposition.members.empty()) {
            return join_names(decomposition);
        }
    }

    return to_decimal(value);
}

} // namespace

std::optional<FormatStyle> parse_format_style(std::string_view letter) {
    if (letter.size() != 1) {
        return std::nullopt;
    }
    switch (letter.front()) {
        case 'G': case 'g': return FormatStyle::General;
        case 'F': case 'f': return FormatStyle::Flags;
        case 'D': case 'd': return FormatStyle::Decimal;
        case 'X': case 'x': return FormatStyle::Hex;
        default: return std::nullopt;
    }
}

std::string format(const EnumDescriptor& descriptor, WideInt raw, FormatStyle style) {
    const WideInt value = from_integral(descriptor, raw);
    const bool fits = fits_width(raw, descriptor.width(), descriptor.is_signed());

    switch (style) {
        case FormatStyle::General:
            return fits ? format_names(descriptor, value, true) : to_decimal(raw);
        case FormatStyle::Flags:
            return fits ? format_names(descriptor, value, false) : to_decimal(raw);
        case FormatStyle::Decimal:
            return to_decimal(value);
        case FormatStyle::Hex:
            return to_hex(bit_pattern(value, descriptor.width()), bit_count(descriptor.width()) / 4);
    }
    return to_decimal(value);
}

Result<WideInt, ParseError> parse(const EnumDescriptor& descriptor, std::string_view text,
                                  bool case_sensitive) {
    std::string input(text);
    boost::algorithm::trim(input);
    if (input.empty()) {
        return ParseError{ParseError::Kind::EmptyInput, {}};
    }

    std::vector<std::string> tokens;
    boost::algorithm::split(tokens, input, boost::algorithm::is_any_of(","));

    WideUInt bits = 0;
    for (auto& token : tokens) {
        boost::algorithm::trim(token);

        if (const EnumMember* member = descriptor.find_by_name(token, case_sensitive)) {
            bits |= bit_pattern(member->value, descriptor.width());
            continue;
        }

        auto literal = parse_decimal(token);
        if (!literal) {
            return ParseError{ParseError::Kind::UnknownMember, token};
        }
        if (!fits_width(*literal, descriptor.width(), descriptor.is_signed())) {
            return ParseError{ParseError::Kind::ValueOutOfRange, token};
        }
        bits |= bit_pattern(*literal, descriptor.width());
    }

    return from_integral(descriptor, static_cast<WideInt>(bits));
}

} // namespace sbr
