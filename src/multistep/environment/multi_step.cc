#include "multistep/environment/multi_step.h"
#include "multistep/errors.h"
#include "multistep/frame_stack.h"

namespace multistep::environment {

MultiStepEnvironment::MultiStepEnvironment(
    std::unique_ptr<VirtualEnvironment> env, size_t n_obs, size_t n_action,
    reduce::ReduceMode reward_reduce, std::optional<size_t> max_episode_steps,
    std::optional<torch::Dtype> box_dtype)
    : env_(std::move(env)), n_obs_(n_obs), n_action_(n_action),
      reward_reduce_(reward_reduce), max_episode_steps_(max_episode_steps),
      observation_space_([&] {
        if (!env_)
          throw std::invalid_argument("Environment must not be null.");
        if (n_obs_ == 0)
          throw std::invalid_argument(
              "Number of stacked observations must be greater than 0.");
        return space::repeat(env_->observation_space(),
                             static_cast<int64_t>(n_obs_), box_dtype);
      }()),
      action_space_([&] {
        if (n_action_ == 0)
          throw std::invalid_argument(
              "Number of actions per step must be greater than 0.");
        return space::repeat(env_->action_space(),
                             static_cast<int64_t>(n_action_), box_dtype);
      }()) {
  if (max_episode_steps_.has_value() && max_episode_steps_.value() == 0)
    throw std::invalid_argument("Max episode steps must be greater than 0.");
}

Frame MultiStepEnvironment::reset(const ResetOptions &options) {
  auto observation = env_->reset(options);
  if (buffer_)
    buffer_->reset(n_obs_);
  else
    buffer_.emplace(n_obs_);
  buffer_->add_observation(std::move(observation));
  return stack_observations();
}

MacroStep MultiStepEnvironment::step(const std::vector<Action> &actions) {
  if (actions.size() != n_action_)
    throw ActionCountMismatch(n_action_, actions.size());
  if (!buffer_)
    throw std::runtime_error("Cannot step before the environment is reset.");
  auto &buffer = *buffer_;

  // A terminated episode keeps the previous rewards and terminations, no
  // inner step runs and the same reduction is reported again.
  if (!buffer.terminated())
    buffer.begin_macro_step();
  for (const auto &action : actions) {
    if (buffer.terminated())
      break;
    auto result = env_->step(action);
    const bool done = result.terminated || result.truncated;
    buffer.add_observation(std::move(result.observation));
    buffer.add_reward(result.reward);
    buffer.add_termination(done);
    buffer.add_info(result.info);
  }

  auto [reward, done] = buffer.aggregate(reward_reduce_);
  if (max_episode_steps_.has_value() &&
      buffer.episode_steps() >= max_episode_steps_.value())
    done = true;

  Info info;
  for (const auto &[key, window] : buffer.info_fields())
    info.emplace(key, frame_stack::stack_last(window.tail(n_obs_), n_obs_));
  return {stack_observations(), reward, done, std::move(info)};
}

const space::Space &MultiStepEnvironment::observation_space() const {
  return observation_space_;
}

const space::Space &MultiStepEnvironment::action_space() const {
  return action_space_;
}

const step_buffer::StepBuffer &MultiStepEnvironment::buffer() const {
  if (!buffer_)
    throw std::runtime_error("No episode has been started.");
  return *buffer_;
}

bool MultiStepEnvironment::episode_active() const { return buffer_.has_value(); }

size_t MultiStepEnvironment::n_obs() const { return n_obs_; }

size_t MultiStepEnvironment::n_action() const { return n_action_; }

Frame MultiStepEnvironment::stack_observations() const {
  return frame_stack::stack_last(buffer_->observations().tail(n_obs_), n_obs_);
}

} // namespace multistep::environment
