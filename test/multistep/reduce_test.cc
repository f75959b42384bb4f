#include "multistep/errors.h"
#include "multistep/reduce.h"
#include "gtest/gtest.h"

using namespace multistep::reduce;

TEST(ReduceTest, MaxAndAnyDone) {
  const auto result = reduce({1.0f, 3.0f, 2.0f}, {false, false, true},
                             ReduceMode::kMax);
  EXPECT_FLOAT_EQ(result.reward, 3.0f);
  EXPECT_TRUE(result.done);
}

TEST(ReduceTest, SumWithoutDone) {
  const auto result = reduce({1.0f, 3.0f, 2.0f}, {false, false, false},
                             ReduceMode::kSum);
  EXPECT_FLOAT_EQ(result.reward, 6.0f);
  EXPECT_FALSE(result.done);
}

TEST(ReduceTest, MinAndMean) {
  const std::vector<float> rewards = {-1.0f, 4.0f, 0.5f, 2.5f};
  const std::vector<bool> dones = {false, true, false, false};
  EXPECT_FLOAT_EQ(reduce(rewards, dones, ReduceMode::kMin).reward, -1.0f);
  EXPECT_FLOAT_EQ(reduce(rewards, dones, ReduceMode::kMean).reward, 1.5f);
  EXPECT_TRUE(reduce(rewards, dones, ReduceMode::kMean).done);
}

TEST(ReduceTest, SumKeepsSmallTermsBetweenLargeOnes) {
  const auto result = reduce({1e8f, 1.0f, -1e8f}, {false, false, false},
                             ReduceMode::kSum);
  EXPECT_FLOAT_EQ(result.reward, 1.0f);
  const auto mean = reduce({1e8f, 1.0f, -1e8f, 0.0f}, {false, false, false, false},
                           ReduceMode::kMean);
  EXPECT_FLOAT_EQ(mean.reward, 0.25f);
}

TEST(ReduceTest, SingleReward) {
  for (auto mode : {ReduceMode::kMax, ReduceMode::kMin, ReduceMode::kMean,
                    ReduceMode::kSum})
    EXPECT_FLOAT_EQ(reduce({7.0f}, {false}, mode).reward, 7.0f)
        << to_string(mode);
}

TEST(ReduceTest, EmptyRewardsThrow) {
  EXPECT_THROW(reduce({}, {}, ReduceMode::kMax),
               multistep::EmptyReductionInput);
}

TEST(ReduceTest, ParseReduceMode) {
  EXPECT_EQ(parse_reduce_mode("max"), ReduceMode::kMax);
  EXPECT_EQ(parse_reduce_mode("min"), ReduceMode::kMin);
  EXPECT_EQ(parse_reduce_mode("mean"), ReduceMode::kMean);
  EXPECT_EQ(parse_reduce_mode("sum"), ReduceMode::kSum);
  EXPECT_EQ(to_string(parse_reduce_mode("mean")), "mean");
  try {
    parse_reduce_mode("median");
    FAIL() << "Expected UnsupportedReduction";
  } catch (const multistep::UnsupportedReduction &error) {
    EXPECT_NE(std::string(error.what()).find("median"), std::string::npos);
  }
}
