#pragma once
#include "multistep/environment/multi_step.h"
#include "multistep/reduce.h"
#include <filesystem>
#include <memory>
#include <optional>
#include <yaml-cpp/yaml.h>

namespace multistep::config {

struct Config {
  size_t n_obs;
  size_t n_action;
  reduce::ReduceMode reward_reduce;
  std::optional<size_t> max_episode_steps;
  // Box spaces are stacked as uint8 regardless of their dtype when set.
  bool force_uint8_box_spaces;

  // Rollout settings.
  size_t max_num_frames_per_episode;
  bool grayscale;
  int seed;
  size_t num_macro_steps;
  size_t log_episode_frequency;
};

Config parse_config(const YAML::Node &node);
Config load_config(const std::filesystem::path &path);

std::unique_ptr<environment::MultiStepEnvironment>
create_environment(std::unique_ptr<environment::VirtualEnvironment> env,
                   const Config &config);

} // namespace multistep::config
