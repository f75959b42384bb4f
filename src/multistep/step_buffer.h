#pragma once
#include "multistep/frame.h"
#include "multistep/reduce.h"
#include "multistep/ring_buffer.h"
#include <map>
#include <string>
#include <torch/torch.h>
#include <vector>

namespace multistep::step_buffer {

// Temporal store for one episode. Observations and info fields live in
// windows of `n_obs + 1` entries. Rewards and terminations only cover the
// current macro-step and are cleared by `begin_macro_step`. The inner step
// count runs over the whole episode and is only cleared by `reset`.
class StepBuffer {
public:
  explicit StepBuffer(size_t n_obs);

  void add_observation(Frame observation);
  void add_reward(float reward);
  void add_termination(bool terminated);
  void add_info(const Info &info);

  void begin_macro_step();
  void reset(size_t n_obs);

  // True when the most recent inner step signalled termination.
  bool terminated() const;
  // Inner steps recorded since the episode started.
  size_t episode_steps() const;

  reduce::Reduction aggregate(reduce::ReduceMode mode) const;

  const ring_buffer::RingBuffer<Frame> &observations() const;
  const std::vector<float> &rewards() const;
  const std::vector<bool> &terminations() const;
  const std::map<std::string, ring_buffer::RingBuffer<torch::Tensor>> &
  info_fields() const;
  size_t n_obs() const;

private:
  size_t n_obs_;
  ring_buffer::RingBuffer<Frame> observations_;
  std::vector<float> rewards_;
  std::vector<bool> terminations_;
  size_t episode_steps_ = 0;
  std::map<std::string, ring_buffer::RingBuffer<torch::Tensor>> info_fields_;
};

} // namespace multistep::step_buffer
