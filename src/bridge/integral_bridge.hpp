#pragma once

#include "../descriptor/enum_descriptor.hpp"
#include <optional>

namespace sbr {

// Exact conversion of a member value; Overflow when it does not fit the
// descriptor's declared width and signedness.
Result<WideInt, IntegralBridgeError> to_integral(const EnumDescriptor& descriptor, WideInt member_value);

// Bit reinterpretation into the declared width. Never fails and does not
// check membership: undefined values are returned as-is.
WideInt from_integral(const EnumDescriptor& descriptor, WideInt raw);

// Strict variant: raw must fit the width and be either a declared value or a
// non-zero exact union of atomic members.
std::optional<WideInt> from_integral_checked(const EnumDescriptor& descriptor, WideInt raw);

} // namespace sbr
