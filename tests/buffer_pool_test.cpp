#include "client/buffer_pool.hh"
#include <gtest/gtest.h>
#include <cstring>
#include <stdexcept>
#include <vector>

using namespace courier;

TEST(BufferPoolTest, AcquireGivesFixedCapacity) {
  auto pool{buffer_pool::create(1024, 4)};
  auto buffer{pool->acquire()};
  EXPECT_EQ(buffer.capacity(), 1024u);
  EXPECT_EQ(buffer.size(), 0u);
  EXPECT_TRUE(buffer.empty());
  std::memcpy(buffer.data(), "hello", 5);
  buffer.resize(5);
  EXPECT_EQ(buffer.view(), "hello");
  buffer.resize(4096);
  EXPECT_EQ(buffer.size(), 1024u);
}

TEST(BufferPoolTest, ReleasedBuffersAreReused) {
  auto pool{buffer_pool::create(64, 4)};
  {
    auto first{pool->acquire()};
    auto second{pool->acquire()};
  }
  EXPECT_EQ(pool->statistics().allocated, 2u);
  EXPECT_EQ(pool->statistics().pooled, 2u);
  auto again{pool->acquire()};
  const auto stats{pool->statistics()};
  EXPECT_EQ(stats.allocated, 2u);
  EXPECT_EQ(stats.reused, 1u);
  EXPECT_EQ(stats.pooled, 1u);
}

TEST(BufferPoolTest, KeepsAtMostMaxPooled) {
  auto pool{buffer_pool::create(64, 2)};
  {
    std::vector<pooled_buffer> held;
    for (int i = 0; i < 5; ++i) {
      held.push_back(pool->acquire());
    }
  }
  EXPECT_EQ(pool->statistics().pooled, 2u);
  pool->clear();
  EXPECT_EQ(pool->statistics().pooled, 0u);
}

TEST(BufferPoolTest, MoveTransfersOwnership) {
  auto pool{buffer_pool::create(32, 4)};
  auto a{pool->acquire()};
  a.resize(3);
  pooled_buffer b{std::move(a)};
  EXPECT_EQ(a.capacity(), 0u);
  EXPECT_EQ(b.size(), 3u);
  b.release();
  EXPECT_EQ(b.capacity(), 0u);
  EXPECT_EQ(pool->statistics().pooled, 1u);
}

TEST(BufferPoolTest, BufferOutlivesPoolHandle) {
  auto pool{buffer_pool::create(16, 1)};
  auto buffer{pool->acquire()};
  pool.reset();
  buffer.resize(16);
  EXPECT_EQ(buffer.size(), 16u);
}

TEST(BufferPoolTest, ZeroChunkSizeIsRejected) {
  EXPECT_THROW(buffer_pool::create(0), std::invalid_argument);
}
