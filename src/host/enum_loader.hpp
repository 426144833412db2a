#pragma once

#include "../common/config.hpp"
#include "../descriptor/descriptor_registry.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace sbr {

// Registers data-declared enums; invalid declarations are logged and skipped.
// Returns the number registered.
size_t register_declarations(DescriptorRegistry& registry,
                             const std::vector<EnumDeclaration>& declarations);

// Same shape as an "enums" entry of the configuration file.
nlohmann::json describe(const EnumDescriptor& descriptor);

} // namespace sbr
