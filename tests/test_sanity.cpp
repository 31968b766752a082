#include "gtest/gtest.h"
#include "pool_cpp/config.hpp"
#include "pool_cpp/pool.hpp"
#include "pool_cpp/wrapper.hpp"

TEST(SanityTest, DefaultsMatchDocumentedValues) {
  pool_cpp::PoolConfiguration cfg;

  // Five resources, five seconds.
  EXPECT_EQ(cfg.size, 5u);
  EXPECT_EQ(cfg.timeout, std::chrono::seconds(5));

  // No logger unless asked for one.
  EXPECT_FALSE(cfg.logger);
}
