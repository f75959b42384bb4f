#include "multistep/step_buffer.h"
#include <stdexcept>

namespace multistep::step_buffer {

StepBuffer::StepBuffer(size_t n_obs)
    : n_obs_(n_obs), observations_([&] {
        if (n_obs == 0)
          throw std::invalid_argument("Frame stack must be greater than 0.");
        return n_obs + 1;
      }()) {}

void StepBuffer::add_observation(Frame observation) {
  observations_.push_back(std::move(observation));
}

void StepBuffer::add_reward(float reward) {
  rewards_.push_back(reward);
  episode_steps_++;
}

void StepBuffer::add_termination(bool terminated) {
  terminations_.push_back(terminated);
}

void StepBuffer::add_info(const Info &info) {
  for (const auto &[key, value] : info) {
    auto it = info_fields_.find(key);
    if (it == info_fields_.end())
      it = info_fields_
               .emplace(key, ring_buffer::RingBuffer<torch::Tensor>(n_obs_ + 1))
               .first;
    it->second.push_back(value);
  }
}

void StepBuffer::begin_macro_step() {
  rewards_.clear();
  terminations_.clear();
}

void StepBuffer::reset(size_t n_obs) { *this = StepBuffer(n_obs); }

bool StepBuffer::terminated() const {
  return !terminations_.empty() && terminations_.back();
}

size_t StepBuffer::episode_steps() const { return episode_steps_; }

reduce::Reduction StepBuffer::aggregate(reduce::ReduceMode mode) const {
  if (rewards_.size() != terminations_.size())
    throw std::logic_error("Rewards and terminations must be the same length.");
  return reduce::reduce(rewards_, terminations_, mode);
}

const ring_buffer::RingBuffer<Frame> &StepBuffer::observations() const {
  return observations_;
}

const std::vector<float> &StepBuffer::rewards() const { return rewards_; }

const std::vector<bool> &StepBuffer::terminations() const {
  return terminations_;
}

const std::map<std::string, ring_buffer::RingBuffer<torch::Tensor>> &
StepBuffer::info_fields() const {
  return info_fields_;
}

size_t StepBuffer::n_obs() const { return n_obs_; }

} // namespace multistep::step_buffer
