#include "integral_bridge.hpp"
#include "../flags/flag_decomposer.hpp"

namespace sbr {

Result<WideInt, IntegralBridgeError> to_integral(const EnumDescriptor& descriptor, WideInt member_value) {
    if (!fits_width(member_value, descriptor.width(), descriptor.is_signed())) {
        return IntegralBridgeError{IntegralBridgeError::Kind::Overflow, member_value};
    }
    return member_value;
}

WideInt from_integral(const EnumDescriptor& descriptor, WideInt raw) {
    return reinterpret_bits(raw, descriptor.width(), descriptor.is_signed());
}

std::optional<WideInt> from_integral_checked(const EnumDescriptor& descriptor, WideInt raw) {
    if (!fits_width(raw, descriptor.width(), descriptor.is_signed())) {
        return std::nullopt;
    }
    if (descriptor.is_defined(raw)) {
        return raw;
    }
    if (raw != 0 && is_exact_union(descriptor, raw)) {
        return raw;
    }
    return std::nullopt;
}

} // namespace sbr
