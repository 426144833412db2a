#include "descriptor_registry.hpp"
#include <spdlog/spdlog.h>
#include <mutex>

namespace sbr {

DescriptorResult DescriptorRegistry::get_or_build(std::string_view type_id, const Builder& builder) {
    stats_.lookups.fetch_add(1);

    {
        std::shared_lock lock(mutex_);
        auto it = descriptors_.find(std::string(type_id));
        if (it != descriptors_.end()) {
            stats_.hits.fetch_add(1);
            return it->second;
        }
    }

    std::unique_lock lock(mutex_);

    // Double-check in case another thread published it
    auto it = descriptors_.find(std::string(type_id));
    if (it != descriptors_.end()) {
        stats_.hits.fetch_add(1);
        return it->second;
    }

    auto built = builder();
    if (!built) {
        stats_.build_failures.fetch_add(1);
        spdlog::warn("Descriptor build failed: {}", to_string(built.error()));
        return built.error();
    }

    auto descriptor = std::make_shared<const EnumDescriptor>(std::move(built).value());
    std::string key(type_id);
    descriptors_.emplace(key, descriptor);
    order_.push_back(std::move(key));
    stats_.builds.fetch_add(1);

    spdlog::debug("Registered enum '{}' with {} members ({}-bit {})",
                  type_id, descriptor->size(), bit_count(descriptor->width()),
                  descriptor->is_signed() ? "signed" : "unsigned");

    return DescriptorPtr(descriptor);
}

DescriptorResult DescriptorRegistry::register_descriptor(std::string type_id,
                                                         std::vector<EnumMember> members,
                                                         IntegralWidth width,
                                                         bool is_signed) {
    const std::string key = type_id;
    return get_or_build(key, [&]() {
        return EnumDescriptor::build(std::move(type_id), std::move(members), width, is_signed);
    });
}

DescriptorPtr DescriptorRegistry::find(std::string_view type_id) const {
    stats_.lookups.fetch_add(1);
    std::shared_lock lock(mutex_);
    auto it = descriptors_.find(std::string(type_id));
    if (it == descriptors_.end()) {
        return nullptr;
    }
    stats_.hits.fetch_add(1);
    return it->second;
}

std::vector<std::string> DescriptorRegistry::type_ids() const {
    std::shared_lock lock(mutex_);
    return order_;
}

size_t DescriptorRegistry::size() const {
    std::shared_lock lock(mutex_);
    return descriptors_.size();
}

} // namespace sbr
