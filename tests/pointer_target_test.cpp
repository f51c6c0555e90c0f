#include <memory>
#include <optional>
#include <string>

#include <gtest/gtest.h>

#include "etfcast/cast/pointer_target.hpp"

TEST(PointerTarget, LeafTypeAndDepth) {
    using Chain = std::unique_ptr<std::optional<std::shared_ptr<int>>>;
    static_assert(std::is_same_v<etfcast::cast::PointerTarget<Chain>::leaf_type, int>);
    static_assert(etfcast::cast::PointerTarget<Chain>::depth() == 3);
    static_assert(etfcast::cast::PointerTarget<int>::depth() == 0);
    static_assert(etfcast::cast::PointerTarget<Chain>::leaf_shape() == etfcast::cast::TargetShape::Integer);
    SUCCEED();
}

TEST(PointerTarget, AssignAllocatesEveryLayer) {
    std::unique_ptr<std::optional<std::shared_ptr<int>>> slot;
    etfcast::cast::PointerTarget<decltype(slot)> target(&slot);
    EXPECT_EQ(target.existing_leaf(), nullptr);

    target.assign(42);
    ASSERT_TRUE(slot);
    ASSERT_TRUE(slot->has_value());
    ASSERT_TRUE(**slot);
    EXPECT_EQ(***slot, 42);
    ASSERT_NE(target.existing_leaf(), nullptr);
    EXPECT_EQ(*target.existing_leaf(), 42);
}

TEST(PointerTarget, AssignReplacesSharedNodeInsteadOfWritingThrough) {
    auto shared = std::make_shared<std::string>("before");
    std::shared_ptr<std::string> slot = shared;
    etfcast::cast::PointerTarget<std::shared_ptr<std::string>>(&slot).assign(std::string("after"));
    EXPECT_EQ(*slot, "after");
    EXPECT_EQ(*shared, "before");
}

TEST(PointerTarget, ClearResetsOutermostLayer) {
    std::optional<std::unique_ptr<int>> slot = std::make_unique<int>(3);
    etfcast::cast::PointerTarget<decltype(slot)> target(&slot);
    ASSERT_EQ(target.clear_to_absent().code, etfcast::core::StatusCode::Ok);
    EXPECT_FALSE(slot.has_value());
}

TEST(PointerTarget, BareValueCannotBeCleared) {
    int slot = 9;
    etfcast::cast::PointerTarget<int> target(&slot);
    const etfcast::core::Status s = target.clear_to_absent();
    EXPECT_EQ(s.code, etfcast::core::StatusCode::NotWritable);
    EXPECT_EQ(s.domain, etfcast::core::StatusDomain::Cast);
    EXPECT_EQ(slot, 9);
}
