#pragma once
#include "multistep/environment/environment.h"
#include "multistep/reduce.h"
#include "multistep/step_buffer.h"
#include <memory>
#include <optional>
#include <vector>

namespace multistep::environment {

struct MacroStep {
  // `n_obs` most recent observations stacked along the leading axis.
  Frame observation;
  float reward;
  // Terminated or truncated, there is no separate truncation flag.
  bool done;
  Info info;
};

// Drives the wrapped environment through `n_action` inner steps per call and
// reports a stacked window of the last `n_obs` observations.
class MultiStepEnvironment {
public:
  MultiStepEnvironment(std::unique_ptr<VirtualEnvironment> env, size_t n_obs,
                       size_t n_action,
                       reduce::ReduceMode reward_reduce = reduce::ReduceMode::kMax,
                       std::optional<size_t> max_episode_steps = std::nullopt,
                       std::optional<torch::Dtype> box_dtype = std::nullopt);

  Frame reset(const ResetOptions &options = {});
  MacroStep step(const std::vector<Action> &actions);

  const space::Space &observation_space() const;
  const space::Space &action_space() const;
  // Throws if no episode has been started.
  const step_buffer::StepBuffer &buffer() const;
  bool episode_active() const;
  size_t n_obs() const;
  size_t n_action() const;

private:
  Frame stack_observations() const;

  std::unique_ptr<VirtualEnvironment> env_;
  size_t n_obs_;
  size_t n_action_;
  reduce::ReduceMode reward_reduce_;
  std::optional<size_t> max_episode_steps_;
  space::Space observation_space_;
  space::Space action_space_;
  std::optional<step_buffer::StepBuffer> buffer_;
};

} // namespace multistep::environment
