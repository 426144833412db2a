#include "enum_loader.hpp"
#include <spdlog/spdlog.h>

namespace sbr {

size_t register_declarations(DescriptorRegistry& registry,
                             const std::vector<EnumDeclaration>& declarations) {
    size_t registered = 0;

    for (const auto& decl : declarations) {
        auto width = width_from_bits(decl.width);
        if (!width) {
            spdlog::warn("Skipping enum '{}': unsupported width {}", decl.type_id, decl.width);
            continue;
        }

        std::vector<EnumMember> members;
        members.reserve(decl.members.size());
        for (const auto& member : decl.members) {
            members.push_back(EnumMember{member.name, member.value});
        }

        auto descriptor = registry.register_descriptor(decl.type_id, std::move(members), *width, decl.is_signed);
        if (!descriptor) {
            spdlog::warn("Skipping enum '{}': {}", decl.type_id, to_string(descriptor.error()));
            continue;
        }
        ++registered;
    }

    spdlog::info("Registered {} of {} declared enums", registered, declarations.size());
    return registered;
}

nlohmann::json describe(const EnumDescriptor& descriptor) {
    nlohmann::json members = nlohmann::json::array();
    for (const auto& member : descriptor.members()) {
        nlohmann::json value;
        if (member.value < 0) {
            value = static_cast<int64_t>(member.value);
        } else {
            value = static_cast<uint64_t>(member.value);
        }
        members.push_back({{"name", member.name}, {"value", value}});
    }

    return {
        {"type_id", descriptor.type_id()},
        {"width", bit_count(descriptor.width())},
        {"signed", descriptor.is_signed()},
        {"members", members}
    };
}

} // namespace sbr
