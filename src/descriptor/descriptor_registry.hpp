#pragma once

#include "enum_descriptor.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sbr {

using DescriptorPtr = std::shared_ptr<const EnumDescriptor>;
using DescriptorResult = Result<DescriptorPtr, DescriptorBuildError>;

// Lazily populated cache of descriptors keyed by type id. Entries are never
// evicted; a published descriptor is immutable and safe to share across threads.
class DescriptorRegistry {
public:
    using Builder = std::function<Result<EnumDescriptor, DescriptorBuildError>()>;

    DescriptorRegistry() = default;
    DescriptorRegistry(const DescriptorRegistry&) = delete;
    DescriptorRegistry& operator=(const DescriptorRegistry&) = delete;

    // Runs builder at most once per type id; failures are returned, not cached.
    // builder runs under the exclusive lock and must not call back into this
    // registry (including view_of for another enum), or it deadlocks.
    DescriptorResult get_or_build(std::string_view type_id, const Builder& builder);

    DescriptorResult register_descriptor(std::string type_id,
                                         std::vector<EnumMember> members,
                                         IntegralWidth width,
                                         bool is_signed);

    DescriptorPtr find(std::string_view type_id) const;
    std::vector<std::string> type_ids() const;  // registration order
    size_t size() const;

    struct Stats {
        std::atomic<uint64_t> lookups{0};
        std::atomic<uint64_t> hits{0};
        std::atomic<uint64_t> builds{0};
        std::atomic<uint64_t> build_failures{0};
    };

    const Stats& get_stats() const { return stats_; }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, DescriptorPtr> descriptors_;
    std::vector<std::string> order_;
    mutable Stats stats_;
};

} // namespace sbr
