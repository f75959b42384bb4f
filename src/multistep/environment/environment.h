#pragma once
#include "multistep/frame.h"
#include "multistep/space.h"
#include <optional>
#include <torch/torch.h>

namespace multistep::environment {

typedef torch::Tensor Action;

struct ResetOptions {
  std::optional<int> seed;
};

struct Step {
  Frame observation;
  float reward;
  bool terminated;
  bool truncated;
  Info info;
};

class VirtualEnvironment {
public:
  virtual ~VirtualEnvironment() = default;
  virtual Frame reset(const ResetOptions &options) = 0;
  virtual Step step(const Action &action) = 0;
  virtual const space::Space &observation_space() const = 0;
  virtual const space::Space &action_space() const = 0;
};

} // namespace multistep::environment
