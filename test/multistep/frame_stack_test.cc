#include "multistep/frame_stack.h"
#include "gtest/gtest.h"
#include <torch/torch.h>
#include <vector>

using multistep::Frame;
using multistep::frame_stack::stack_last;

namespace {
torch::Tensor frame(float value) {
  return torch::full({2, 3}, value, torch::kFloat32);
}
} // namespace

TEST(FrameStackTest, LongHistoryKeepsMostRecentFrames) {
  std::vector<torch::Tensor> history = {frame(0), frame(1), frame(2), frame(3),
                                        frame(4)};
  const auto stacked = stack_last(history, 3);
  EXPECT_EQ(stacked.sizes(), std::vector<int64_t>({3, 2, 3}));
  EXPECT_EQ(stacked.dtype(), torch::kFloat32);
  for (int64_t i = 0; i < 3; ++i)
    EXPECT_TRUE(torch::equal(stacked[i], history[i + 2])) << "Frame " << i;
}

TEST(FrameStackTest, ExactHistoryLength) {
  std::vector<torch::Tensor> history = {frame(5), frame(6)};
  const auto stacked = stack_last(history, 2);
  EXPECT_TRUE(torch::equal(stacked[0], frame(5)));
  EXPECT_TRUE(torch::equal(stacked[1], frame(6)));
}

// A = 1, B = 2 stacked to 4 frames gives [A, A, A, B].
TEST(FrameStackTest, ShortHistoryRepeatsOldestFrame) {
  std::vector<torch::Tensor> history = {frame(1), frame(2)};
  const auto stacked = stack_last(history, 4);
  EXPECT_EQ(stacked.sizes(), std::vector<int64_t>({4, 2, 3}));
  EXPECT_TRUE(torch::equal(stacked[0], frame(1)));
  EXPECT_TRUE(torch::equal(stacked[1], frame(1)));
  EXPECT_TRUE(torch::equal(stacked[2], frame(1)));
  EXPECT_TRUE(torch::equal(stacked[3], frame(2)));
}

TEST(FrameStackTest, SingleFrameIsDuplicated) {
  const auto initial = torch::arange(6, torch::kUInt8).reshape({2, 3});
  const auto stacked = stack_last(std::vector<torch::Tensor>{initial}, 4);
  EXPECT_EQ(stacked.dtype(), torch::kUInt8);
  for (int64_t i = 0; i < 4; ++i)
    EXPECT_TRUE(torch::equal(stacked[i], initial));
}

TEST(FrameStackTest, ScalarFrames) {
  std::vector<torch::Tensor> history = {torch::tensor(1.0f),
                                        torch::tensor(2.0f)};
  const auto stacked = stack_last(history, 3);
  EXPECT_TRUE(torch::equal(stacked, torch::tensor({1.0f, 1.0f, 2.0f})));
}

TEST(FrameStackTest, StructuredFramesStackPerItem) {
  auto make = [](float value) {
    return Frame(Frame::Items{{"pixels", frame(value)},
                              {"speed", torch::tensor(value * 10)}});
  };
  std::vector<Frame> history = {make(1), make(2)};
  const auto stacked = stack_last(history, 3);
  ASSERT_FALSE(stacked.is_tensor());
  ASSERT_EQ(stacked.items().size(), 2);
  EXPECT_EQ(stacked.items()[0].first, "pixels");
  const auto &pixels = stacked.at("pixels").tensor();
  EXPECT_EQ(pixels.sizes(), std::vector<int64_t>({3, 2, 3}));
  EXPECT_TRUE(torch::equal(pixels[0], frame(1)));
  EXPECT_TRUE(torch::equal(pixels[2], frame(2)));
  EXPECT_TRUE(torch::equal(stacked.at("speed").tensor(),
                           torch::tensor({10.0f, 10.0f, 20.0f})));
}

TEST(FrameStackTest, InvalidInputsThrow) {
  EXPECT_THROW(stack_last(std::vector<torch::Tensor>{}, 2),
               std::invalid_argument);
  EXPECT_THROW(stack_last(std::vector<torch::Tensor>{frame(1)}, 0),
               std::invalid_argument);
  std::vector<torch::Tensor> mixed = {frame(1),
                                      torch::zeros({2, 3}, torch::kInt32)};
  EXPECT_THROW(stack_last(mixed, 2), std::invalid_argument);
}
