#include "wide_int.hpp"
#include <algorithm>

namespace sbr {

namespace {
    // Parsed magnitudes above this are rejected; every supported width fits well below it.
    constexpr WideUInt MAX_PARSE_MAGNITUDE = WideUInt{1} << 100;
}

std::optional<IntegralWidth> width_from_bits(unsigned bits) {
    switch (bits) {
        case 8: return IntegralWidth::Bits8;
        case 16: return IntegralWidth::Bits16;
        case 32: return IntegralWidth::Bits32;
        case 64: return IntegralWidth::Bits64;
        default: return std::nullopt;
    }
}

std::string to_decimal(WideInt value) {
    if (value == 0) {
        return "0";
    }

    const bool negative = value < 0;
    WideUInt magnitude = negative ? WideUInt{0} - static_cast<WideUInt>(value)
                                  : static_cast<WideUInt>(value);

    std::string digits;
    while (magnitude != 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(magnitude % 10)));
        magnitude /= 10;
    }
    if (negative) {
        digits.push_back('-');
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string to_hex(WideUInt bits, unsigned min_digits) {
    static constexpr char HEX_DIGITS[] = "0123456789ABCDEF";

    std::string digits;
    while (bits != 0) {
        digits.push_back(HEX_DIGITS[static_cast<unsigned>(bits & 0xF)]);
        bits >>= 4;
    }
    while (digits.size() < min_digits || digits.empty()) {
        digits.push_back('0');
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::optional<WideInt> parse_decimal(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    bool negative = false;
    if (text.front() == '+' || text.front() == '-') {
        negative = text.front() == '-';
        text.remove_prefix(1);
        if (text.empty()) {
            return std::nullopt;
        }
    }

    WideUInt magnitude = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        magnitude = magnitude * 10 + static_cast<WideUInt>(c - '0');
        if (magnitude > MAX_PARSE_MAGNITUDE) {
            return std::nullopt;
        }
    }

    const WideInt value = static_cast<WideInt>(magnitude);
    return negative ? -value : value;
}

} // namespace sbr
