#include "flag_decomposer.hpp"

namespace sbr {

std::vector<const EnumMember*> atomic_members(const EnumDescriptor& descriptor) {
    std::vector<const EnumMember*> result;
    for (const auto& member : descriptor.members()) {
        if (is_power_of_two(bit_pattern(member.value, descriptor.width()))) {
            result.push_back(&member);
        }
    }
    return result;
}

Decomposition decompose(const EnumDescriptor& descriptor, WideInt raw) {
    Decomposition result;
    WideUInt working = bit_pattern(raw, descriptor.width());

    // Bits that do not survive reinterpretation into the declared width
    const WideUInt out_of_width =
        static_cast<WideUInt>(raw) ^
        static_cast<WideUInt>(reinterpret_bits(raw, descriptor.width(), descriptor.is_signed()));

    for (const EnumMember* member : atomic_members(descriptor)) {
        const WideUInt bits = bit_pattern(member->value, descriptor.width());
        if ((working & bits) == bits) {
            result.members.push_back(member);
            working &= ~bits;
        }
    }

    result.unrecognized_bits = working | out_of_width;
    return result;
}

bool is_exact_union(const EnumDescriptor& descriptor, WideInt raw) {
    return decompose(descriptor, raw).exact();
}

int count_set_atomic_bits(const EnumDescriptor& descriptor, WideInt raw) {
    WideUInt bits = bit_pattern(raw, descriptor.width()) & valid_mask(descriptor);
    int count = 0;
    while (bits != 0) {
        bits &= bits - 1;
        ++count;
    }
    return count;
}

WideUInt valid_mask(const EnumDescriptor& descriptor) {
    WideUInt mask = 0;
    for (const EnumMember* member : atomic_members(descriptor)) {
        mask |= bit_pattern(member->value, descriptor.width());
    }
    return mask;
}

bool has_flag(const EnumDescriptor& descriptor, WideInt raw, WideInt flag) {
    const WideUInt flag_bits = bit_pattern(flag, descriptor.width());
    return (bit_pattern(raw, descriptor.width()) & flag_bits) == flag_bits;
}

bool is_flag_set(const EnumDescriptor& descriptor) {
    WideUInt seen = 0;
    for (const auto& member : descriptor.members()) {
        const WideUInt bits = bit_pattern(member.value, descriptor.width());
        if (bits == 0) {
            continue;
        }
        if (!is_power_of_two(bits) || (seen & bits) != 0) {
            return false;
        }
        seen |= bits;
    }
    return true;
}

} // namespace sbr
