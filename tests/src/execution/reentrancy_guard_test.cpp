#include <benefactor/execution/reentrancy_guard.hpp>
#include <gtest/gtest.h>

TEST(reentrancy_guard, second_claim_fails_while_first_is_held) {
  auto lock = benefactor::execution::reentrancy_lock{};
  {
    auto outer = benefactor::execution::reentrancy_guard{lock};
    EXPECT_TRUE(outer.acquired());
    EXPECT_TRUE(lock.entered());
    {
      auto inner = benefactor::execution::reentrancy_guard{lock};
      EXPECT_FALSE(inner.acquired());
    }
    // A refused claim must not release the outer one.
    EXPECT_TRUE(lock.entered());
  }
  EXPECT_FALSE(lock.entered());
  auto again = benefactor::execution::reentrancy_guard{lock};
  EXPECT_TRUE(again.acquired());
}
