#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sbr {

// Widest integer: holds every 8/16/32/64-bit signed or unsigned value exactly.
using WideInt = __int128;
using WideUInt = unsigned __int128;

enum class IntegralWidth : uint8_t {
    Bits8 = 8,
    Bits16 = 16,
    Bits32 = 32,
    Bits64 = 64
};

constexpr unsigned bit_count(IntegralWidth width) {
    return static_cast<unsigned>(width);
}

constexpr WideUInt width_mask(IntegralWidth width) {
    return (WideUInt{1} << bit_count(width)) - 1;
}

constexpr WideInt min_value(IntegralWidth width, bool is_signed) {
    if (!is_signed) {
        return 0;
    }
    return -static_cast<WideInt>(WideUInt{1} << (bit_count(width) - 1));
}

constexpr WideInt max_value(IntegralWidth width, bool is_signed) {
    const unsigned value_bits = is_signed ? bit_count(width) - 1 : bit_count(width);
    return static_cast<WideInt>((WideUInt{1} << value_bits) - 1);
}

constexpr bool fits_width(WideInt value, IntegralWidth width, bool is_signed) {
    return value >= min_value(width, is_signed) && value <= max_value(width, is_signed);
}

// Two's-complement bit pattern of value, truncated to width.
constexpr WideUInt bit_pattern(WideInt value, IntegralWidth width) {
    return static_cast<WideUInt>(value) & width_mask(width);
}

// Truncates raw to width bits and sign-extends when is_signed.
constexpr WideInt reinterpret_bits(WideInt raw, IntegralWidth width, bool is_signed) {
    WideUInt bits = bit_pattern(raw, width);
    if (is_signed && ((bits >> (bit_count(width) - 1)) & 1) != 0) {
        bits |= ~width_mask(width);
    }
    return static_cast<WideInt>(bits);
}

constexpr bool is_power_of_two(WideUInt bits) {
    return bits != 0 && (bits & (bits - 1)) == 0;
}

std::optional<IntegralWidth> width_from_bits(unsigned bits);

std::string to_decimal(WideInt value);

// Upper-case hex, zero-padded to at least min_digits.
std::string to_hex(WideUInt bits, unsigned min_digits);

// Optional sign followed by decimal digits; nullopt on anything else.
std::optional<WideInt> parse_decimal(std::string_view text);

} // namespace sbr
