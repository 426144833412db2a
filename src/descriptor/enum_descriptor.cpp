#include "enum_descriptor.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <unordered_set>

namespace sbr {

std::string fold_case(std::string_view text) {
    return boost::algorithm::to_lower_copy(std::string(text));
}

Result<EnumDescriptor, DescriptorBuildError> EnumDescriptor::build(std::string type_id,
                                                                    std::vector<EnumMember> members,
                                                                    IntegralWidth width,
                                                                    bool is_signed) {
    if (members.empty()) {
        return DescriptorBuildError{DescriptorBuildError::Kind::EmptyMembers, type_id, {}};
    }

    std::unordered_set<std::string_view> seen;
    for (const auto& member : members) {
        if (!fits_width(member.value, width, is_signed)) {
            return DescriptorBuildError{DescriptorBuildError::Kind::ValueOutOfRange, type_id, member.name};
        }
        if (!seen.insert(member.name).second) {
            return DescriptorBuildError{DescriptorBuildError::Kind::DuplicateName, type_id, member.name};
        }
    }

    return EnumDescriptor(std::move(type_id), std::move(members), width, is_signed);
}

EnumDescriptor::EnumDescriptor(std::string type_id, std::vector<EnumMember> members,
                               IntegralWidth width, bool is_signed)
    : type_id_(std::move(type_id)), width_(width), is_signed_(is_signed),
      members_(std::move(members)) {
    by_name_.reserve(members_.size());
    by_folded_name_.reserve(members_.size());
    by_value_.reserve(members_.size());

    // emplace keeps the first declared entry for aliases and case collisions
    for (size_t i = 0; i < members_.size(); ++i) {
        by_name_.emplace(members_[i].name, i);
        by_folded_name_.emplace(fold_case(members_[i].name), i);
        by_value_.emplace(members_[i].value, i);
    }
}

std::vector<std::string_view> EnumDescriptor::names() const {
    std::vector<std::string_view> result;
    result.reserve(members_.size());
    for (const auto& member : members_) {
        result.emplace_back(member.name);
    }
    return result;
}

std::vector<WideInt> EnumDescriptor::values() const {
    std::vector<WideInt> result;
    result.reserve(members_.size());
    for (const auto& member : members_) {
        result.push_back(member.value);
    }
    return result;
}

const EnumMember* EnumDescriptor::find_by_name(std::string_view name, bool case_sensitive) const {
    if (case_sensitive) {
        auto it = by_name_.find(std::string(name));
        return it != by_name_.end() ? &members_[it->second] : nullptr;
    }

    auto it = by_folded_name_.find(fold_case(name));
    return it != by_folded_name_.end() ? &members_[it->second] : nullptr;
}

const EnumMember* EnumDescriptor::find_by_value(WideInt value) const {
    auto it = by_value_.find(value);
    return it != by_value_.end() ? &members_[it->second] : nullptr;
}

} // namespace sbr
