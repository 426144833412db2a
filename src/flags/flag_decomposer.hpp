#pragma once

#include "../descriptor/enum_descriptor.hpp"
#include <vector>

namespace sbr {

struct Decomposition {
    // Atomic members in declaration order; pointers into the descriptor.
    std::vector<const EnumMember*> members;
    WideUInt unrecognized_bits = 0;

    bool exact() const { return unrecognized_bits == 0; }
};

// Non-zero, single-bit members in declaration order.
std::vector<const EnumMember*> atomic_members(const EnumDescriptor& descriptor);

// Splits raw into declared single-bit members. Each atomic member whose bits
// are all still set in the working copy is emitted and its bits cleared, so an
// atomic alias declared later is not emitted twice. Leftover bits, including
// any raw carries beyond the declared width, land in unrecognized_bits.
Decomposition decompose(const EnumDescriptor& descriptor, WideInt raw);

bool is_exact_union(const EnumDescriptor& descriptor, WideInt raw);

// Number of raw's bits covered by atomic members, counted by clearing the
// lowest set bit until none remain.
int count_set_atomic_bits(const EnumDescriptor& descriptor, WideInt raw);

// OR of every atomic member.
WideUInt valid_mask(const EnumDescriptor& descriptor);

// True when flag's bits are all set in raw; a zero flag is always contained.
bool has_flag(const EnumDescriptor& descriptor, WideInt raw, WideInt flag);

// True when every member is zero or a single bit and no two non-zero members share a bit.
bool is_flag_set(const EnumDescriptor& descriptor);

} // namespace sbr
