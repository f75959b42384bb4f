#include "multistep/ring_buffer.h"
#include "gtest/gtest.h"
#include <vector>

using multistep::ring_buffer::RingBuffer;

TEST(RingBufferTest, KeepsChronologicalOrderUntilFull) {
  RingBuffer<int> buffer(3);
  EXPECT_TRUE(buffer.empty());
  buffer.push_back(1);
  buffer.push_back(2);
  EXPECT_EQ(buffer.size(), 2);
  EXPECT_EQ(buffer.capacity(), 3);
  EXPECT_EQ(buffer[0], 1);
  EXPECT_EQ(buffer.back(), 2);
}

TEST(RingBufferTest, EvictsOldestWhenFull) {
  RingBuffer<int> buffer(3);
  for (int i = 0; i < 5; ++i)
    buffer.push_back(i);
  EXPECT_EQ(buffer.size(), 3);
  EXPECT_EQ(buffer.capacity(), 3);
  EXPECT_EQ(buffer.tail(3), std::vector<int>({2, 3, 4}));
  EXPECT_EQ(buffer.back(), 4);
}

TEST(RingBufferTest, TailIsClampedToSize) {
  RingBuffer<int> buffer(4);
  buffer.push_back(7);
  buffer.push_back(8);
  EXPECT_EQ(buffer.tail(1), std::vector<int>({8}));
  EXPECT_EQ(buffer.tail(10), std::vector<int>({7, 8}));
}

TEST(RingBufferTest, InvalidAccessThrows) {
  EXPECT_THROW(RingBuffer<int>(0), std::invalid_argument);
  RingBuffer<int> buffer(2);
  EXPECT_THROW(buffer.back(), std::out_of_range);
  buffer.push_back(1);
  EXPECT_EQ(buffer.back(), 1);
}
