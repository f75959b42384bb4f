#include "multistep/config.h"
#include "multistep/environment/ale.h"
#include "tensorboard_logger.h"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <numeric>
#include <torch/torch.h>

template <typename T> float mean(const std::vector<T> &values) {
  if (values.empty())
    throw std::invalid_argument("Values vector is empty.");
  return std::accumulate(values.begin(), values.end(), 0.0f) / values.size();
}

// Uniform integer actions within the bounds of a stacked action space, one
// tensor per inner step.
std::vector<torch::Tensor> sample_actions(const multistep::space::Box &box) {
  const auto low = box.low.to(torch::kFloat64);
  const auto high = box.high.to(torch::kFloat64);
  const auto sample = low + torch::rand(low.sizes(), torch::kFloat64) *
                                (high - low + 1.0);
  return torch::minimum(sample.floor(), high).to(box.dtype).unbind(0);
}

int main(int argc, char **argv) {
  if (argc != 4) {
    std::cerr << "Usage: " << argv[0]
              << " <rom_path> <logger_path> <config_path>" << std::endl;
    return 1;
  }
  const auto start_time =
      std::chrono::system_clock::now().time_since_epoch().count();
  const auto rom_path = std::filesystem::path(argv[1]);
  const auto logger_path = std::filesystem::path(argv[2]).replace_extension(
      "tfevents." + std::to_string(start_time));
  const auto config =
      multistep::config::load_config(std::filesystem::path(argv[3]));

  if (logger_path.has_parent_path() &&
      !std::filesystem::exists(logger_path.parent_path())) {
    std::filesystem::create_directories(logger_path.parent_path());
  }

  torch::manual_seed(config.seed);
  TensorBoardLogger logger(logger_path);

  auto environment = multistep::config::create_environment(
      std::make_unique<multistep::environment::AleEnvironment>(
          rom_path, config.max_num_frames_per_episode, config.grayscale,
          config.seed),
      config);
  const auto &action_space = environment->action_space().box();
  std::cout << "Stacking " << config.n_obs << " observations over "
            << config.n_action << " actions per step, reducing rewards with "
            << multistep::reduce::to_string(config.reward_reduce) << "."
            << std::endl;

  std::vector<float> episode_returns;
  std::vector<size_t> episode_lengths;
  float episode_return = 0.0f;
  size_t episode_length = 0;
  size_t episodes = 0;

  environment->reset();
  for (size_t step = 0; step < config.num_macro_steps; ++step) {
    const auto result = environment->step(sample_actions(action_space));
    episode_return += result.reward;
    episode_length++;
    if (!result.done)
      continue;

    episodes++;
    logger.add_scalar("episode_return", step, episode_return);
    logger.add_scalar("episode_length", step,
                      static_cast<float>(episode_length));
    episode_returns.push_back(episode_return);
    episode_lengths.push_back(episode_length);
    if (episodes % config.log_episode_frequency == 0) {
      std::cout << "Step " << step << ": episodes " << episodes
                << ", mean return " << mean(episode_returns)
                << ", mean length " << mean(episode_lengths) << std::endl;
      logger.add_histogram("episode_returns", step, episode_returns);
      logger.add_histogram("episode_lengths", step, episode_lengths);
      episode_returns.clear();
      episode_lengths.clear();
    }
    episode_return = 0.0f;
    episode_length = 0;
    environment->reset();
  }
  std::cout << "Finished " << config.num_macro_steps << " steps and "
            << episodes << " episodes." << std::endl;
  return 0;
}
