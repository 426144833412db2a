#include <gtest/gtest.h>

#include "descriptor/descriptor_registry.hpp"

#include <atomic>
#include <thread>
#include <vector>

namespace sbr {
namespace {

class DescriptorRegistryTest : public ::testing::Test {
protected:
    static Result<EnumDescriptor, DescriptorBuildError> build_sides() {
        return EnumDescriptor::build("Sides", {{"None", 0}, {"Left", 1}, {"Right", 2}},
                                     IntegralWidth::Bits32, true);
    }

    DescriptorRegistry registry_;
};

TEST_F(DescriptorRegistryTest, BuildsOnFirstUseThenReturnsCached) {
    int calls = 0;
    auto builder = [&]() {
        ++calls;
        return build_sides();
    };

    auto first = registry_.get_or_build("Sides", builder);
    auto second = registry_.get_or_build("Sides", builder);

    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(first.value().get(), second.value().get());
    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_EQ(registry_.get_stats().builds.load(), 1u);
    EXPECT_EQ(registry_.get_stats().hits.load(), 1u);
}

TEST_F(DescriptorRegistryTest, FailedBuildIsNotCached) {
    int calls = 0;
    auto failing = [&]() {
        ++calls;
        return EnumDescriptor::build("Broken", {}, IntegralWidth::Bits32, true);
    };

    auto first = registry_.get_or_build("Broken", failing);
    auto second = registry_.get_or_build("Broken", failing);

    ASSERT_FALSE(first.ok());
    EXPECT_EQ(first.error().kind, DescriptorBuildError::Kind::EmptyMembers);
    ASSERT_FALSE(second.ok());
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(registry_.find("Broken"), nullptr);
    EXPECT_EQ(registry_.get_stats().build_failures.load(), 2u);
}

TEST_F(DescriptorRegistryTest, RegisterDescriptorPublishesOnce) {
    auto first = registry_.register_descriptor("Color", {{"Red", 1}, {"Green", 2}},
                                               IntegralWidth::Bits8, false);
    auto again = registry_.register_descriptor("Color", {{"Blue", 4}}, IntegralWidth::Bits8, false);

    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.value()->size(), 2u);
    EXPECT_EQ(again.value()->members().front().name, "Red");
}

TEST_F(DescriptorRegistryTest, FindAndTypeIdsFollowRegistrationOrder) {
    EXPECT_EQ(registry_.find("Sides"), nullptr);

    ASSERT_TRUE(registry_.register_descriptor("B", {{"X", 1}}, IntegralWidth::Bits8, false).ok());
    ASSERT_TRUE(registry_.register_descriptor("A", {{"Y", 1}}, IntegralWidth::Bits8, false).ok());

    auto ids = registry_.type_ids();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], "B");
    EXPECT_EQ(ids[1], "A");
    ASSERT_NE(registry_.find("A"), nullptr);
    EXPECT_EQ(registry_.find("A")->type_id(), "A");
}

TEST_F(DescriptorRegistryTest, ConcurrentFirstUseBuildsAtMostOnce) {
    constexpr int kThreads = 16;
    std::atomic<int> builds{0};
    std::atomic<bool> go{false};
    std::vector<const EnumDescriptor*> seen(kThreads, nullptr);

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto result = registry_.get_or_build("Sides", [&]() {
                builds.fetch_add(1);
                return build_sides();
            });
            if (result.ok()) {
                seen[i] = result.value().get();
            }
        });
    }

    go.store(true);
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(builds.load(), 1);
    for (const auto* descriptor : seen) {
        ASSERT_NE(descriptor, nullptr);
        EXPECT_EQ(descriptor, seen.front());
    }
}

} // namespace
} // namespace sbr
