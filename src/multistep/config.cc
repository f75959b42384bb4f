#include "multistep/config.h"
#include <stdexcept>
#include <string>

namespace multistep::config {

namespace {

// Falls back only when the key is absent or null, a value of the wrong type
// still throws YAML::BadConversion.
template <typename T>
T get_or(const YAML::Node &node, const std::string &key, const T &fallback) {
  const auto value = node[key];
  if (!value || value.IsNull())
    return fallback;
  return value.as<T>();
}

} // namespace

Config parse_config(const YAML::Node &node) {
  Config config;
  config.n_obs = get_or<size_t>(node, "n_obs", 4);
  config.n_action = get_or<size_t>(node, "n_action", 2);
  config.reward_reduce = reduce::parse_reduce_mode(
      get_or<std::string>(node, "reward_reduce", "max"));
  const auto max_episode_steps = node["max_episode_steps"];
  if (max_episode_steps && !max_episode_steps.IsNull())
    config.max_episode_steps = max_episode_steps.as<size_t>();
  config.force_uint8_box_spaces =
      get_or<bool>(node, "force_uint8_box_spaces", false);
  config.max_num_frames_per_episode =
      get_or<size_t>(node, "max_num_frames_per_episode", 108000);
  config.grayscale = get_or<bool>(node, "grayscale", true);
  config.seed = get_or<int>(node, "seed", 0);
  config.num_macro_steps = get_or<size_t>(node, "num_macro_steps", 10000);
  config.log_episode_frequency =
      get_or<size_t>(node, "log_episode_frequency", 10);

  if (config.n_obs == 0)
    throw std::invalid_argument("n_obs must be greater than 0.");
  if (config.n_action == 0)
    throw std::invalid_argument("n_action must be greater than 0.");
  if (config.max_episode_steps.has_value() &&
      config.max_episode_steps.value() == 0)
    throw std::invalid_argument("max_episode_steps must be greater than 0.");
  if (config.log_episode_frequency == 0)
    throw std::invalid_argument(
        "log_episode_frequency must be greater than 0.");
  return config;
}

Config load_config(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path))
    throw std::invalid_argument("Config file does not exist: " +
                                path.string());
  return parse_config(YAML::LoadFile(path.string()));
}

std::unique_ptr<environment::MultiStepEnvironment>
create_environment(std::unique_ptr<environment::VirtualEnvironment> env,
                   const Config &config) {
  std::optional<torch::Dtype> box_dtype;
  if (config.force_uint8_box_spaces)
    box_dtype = torch::kUInt8;
  return std::make_unique<environment::MultiStepEnvironment>(
      std::move(env), config.n_obs, config.n_action, config.reward_reduce,
      config.max_episode_steps, box_dtype);
}

} // namespace multistep::config
