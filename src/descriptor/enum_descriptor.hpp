#pragma once

#include "../common/errors.hpp"
#include "../common/result.hpp"
#include "../common/wide_int.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sbr {

struct EnumMember {
    std::string name;
    WideInt value;
};

struct WideIntHash {
    size_t operator()(WideInt value) const {
        const auto bits = static_cast<WideUInt>(value);
        const auto low = static_cast<uint64_t>(bits);
        const auto high = static_cast<uint64_t>(bits >> 64);
        return std::hash<uint64_t>{}(low ^ (high * 0x9E3779B97F4A7C15ULL));
    }
};

// Immutable metadata for one symbolic type. Members keep declaration order;
// values may repeat (aliases), names may not.
class EnumDescriptor {
public:
    static Result<EnumDescriptor, DescriptorBuildError> build(std::string type_id,
                                                               std::vector<EnumMember> members,
                                                               IntegralWidth width,
                                                               bool is_signed);

    EnumDescriptor(EnumDescriptor&&) = default;
    EnumDescriptor& operator=(EnumDescriptor&&) = default;
    EnumDescriptor(const EnumDescriptor&) = default;
    EnumDescriptor& operator=(const EnumDescriptor&) = default;

    const std::string& type_id() const { return type_id_; }
    IntegralWidth width() const { return width_; }
    bool is_signed() const { return is_signed_; }

    const std::vector<EnumMember>& members() const { return members_; }
    size_t size() const { return members_.size(); }
    std::vector<std::string_view> names() const;
    std::vector<WideInt> values() const;

    // nullptr when absent. Case-insensitive lookup returns the first
    // declared member whose name folds to the same text.
    const EnumMember* find_by_name(std::string_view name, bool case_sensitive = true) const;
    // First declared member carrying value.
    const EnumMember* find_by_value(WideInt value) const;
    bool is_defined(WideInt value) const { return find_by_value(value) != nullptr; }

    WideInt min_value() const { return sbr::min_value(width_, is_signed_); }
    WideInt max_value() const { return sbr::max_value(width_, is_signed_); }

private:
    EnumDescriptor(std::string type_id, std::vector<EnumMember> members,
                   IntegralWidth width, bool is_signed);

    std::string type_id_;
    IntegralWidth width_;
    bool is_signed_;
    std::vector<EnumMember> members_;

    std::unordered_map<std::string, size_t> by_name_;
    std::unordered_map<std::string, size_t> by_folded_name_;
    std::unordered_map<WideInt, size_t, WideIntHash> by_value_;
};

std::string fold_case(std::string_view text);

} // namespace sbr
