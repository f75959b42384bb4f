#pragma once
#include <string>
#include <vector>

namespace multistep::reduce {

enum class ReduceMode { kMax, kMin, kMean, kSum };

ReduceMode parse_reduce_mode(const std::string &mode);
std::string to_string(ReduceMode mode);

struct Reduction {
  float reward;
  bool done;
};

// Collapses the rewards of several inner steps into one scalar and the done
// flags into their logical OR.
Reduction reduce(const std::vector<float> &rewards,
                 const std::vector<bool> &dones, ReduceMode mode);

} // namespace multistep::reduce
