#include "multistep/reduce.h"
#include "multistep/errors.h"
#include <algorithm>
#include <torch/torch.h>

namespace multistep::reduce {

ReduceMode parse_reduce_mode(const std::string &mode) {
  if (mode == "max")
    return ReduceMode::kMax;
  if (mode == "min")
    return ReduceMode::kMin;
  if (mode == "mean")
    return ReduceMode::kMean;
  if (mode == "sum")
    return ReduceMode::kSum;
  throw UnsupportedReduction(mode);
}

std::string to_string(ReduceMode mode) {
  switch (mode) {
  case ReduceMode::kMax:
    return "max";
  case ReduceMode::kMin:
    return "min";
  case ReduceMode::kMean:
    return "mean";
  case ReduceMode::kSum:
    return "sum";
  }
  throw UnsupportedReduction(std::to_string(static_cast<int>(mode)));
}

Reduction reduce(const std::vector<float> &rewards,
                 const std::vector<bool> &dones, ReduceMode mode) {
  if (rewards.empty())
    throw EmptyReductionInput();
  // Accumulate in double precision, the result is narrowed once.
  const auto values =
      torch::tensor(rewards, torch::kFloat32).to(torch::kFloat64);
  torch::Tensor reward;
  switch (mode) {
  case ReduceMode::kMax:
    reward = values.max();
    break;
  case ReduceMode::kMin:
    reward = values.min();
    break;
  case ReduceMode::kMean:
    reward = values.mean();
    break;
  case ReduceMode::kSum:
    reward = values.sum();
    break;
  default:
    throw UnsupportedReduction(std::to_string(static_cast<int>(mode)));
  }
  const bool done = std::any_of(dones.begin(), dones.end(),
                                [](bool flag) { return flag; });
  return {static_cast<float>(reward.item<double>()), done};
}

} // namespace multistep::reduce
