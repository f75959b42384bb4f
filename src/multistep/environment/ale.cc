#include "multistep/environment/ale.h"
#include <stdexcept>

namespace multistep::environment {

AleEnvironment::AleEnvironment(const std::filesystem::path &rom_path,
                               size_t max_num_frames_per_episode,
                               bool grayscale, int seed)
    : rom_path_(rom_path), ale_(), grayscale_(grayscale),
      action_set_([&] {
        if (rom_path_.empty())
          throw std::invalid_argument("ROM path must not be empty.");
        if (!std::filesystem::exists(rom_path_))
          throw std::invalid_argument("ROM file does not exist: " +
                                      rom_path_.string());
        ale_.setInt("max_num_frames_per_episode",
                    static_cast<int>(max_num_frames_per_episode));
        ale_.setInt("frame_skip", 1);
        ale_.setFloat("repeat_action_probability", 0.0f);
        ale_.setInt("random_seed", seed);
        ale_.loadROM(rom_path_.string());
        return ale_.getMinimalActionSet();
      }()),
      observation_shape_([&] {
        auto &screen = ale_.getScreen();
        std::vector<int64_t> shape = {static_cast<int64_t>(screen.height()),
                                      static_cast<int64_t>(screen.width())};
        if (!grayscale_)
          shape.push_back(3);
        return shape;
      }()),
      observation_space_(space::Box::uniform(0, 255, observation_shape_,
                                             torch::kUInt8)),
      action_space_(space::Box::uniform(
          0, static_cast<double>(action_set_.size() - 1), {}, torch::kInt64)) {
}

Frame AleEnvironment::reset(const ResetOptions &options) {
  if (options.seed.has_value()) {
    // ALE only picks up a new seed when the ROM is loaded.
    ale_.setInt("random_seed", options.seed.value());
    ale_.loadROM(rom_path_.string());
  }
  ale_.reset_game();
  return get_observation();
}

Step AleEnvironment::step(const Action &action) {
  if (action.numel() != 1)
    throw std::invalid_argument("ALE actions must be scalar indices.");
  const int64_t action_index = action.item<int64_t>();
  if (action_index < 0 ||
      action_index >= static_cast<int64_t>(action_set_.size()))
    throw std::out_of_range("Action index out of range: " +
                            std::to_string(action_index));
  ale::reward_t reward = ale_.act(action_set_[action_index]);
  Info info;
  info["lives"] = torch::tensor(ale_.lives(), torch::kInt64);
  info["episode_frame_number"] =
      torch::tensor(ale_.getEpisodeFrameNumber(), torch::kInt64);
  return {.observation = get_observation(),
          .reward = static_cast<float>(reward),
          .terminated = ale_.game_over(false),
          .truncated = ale_.game_truncated(),
          .info = std::move(info)};
}

const space::Space &AleEnvironment::observation_space() const {
  return observation_space_;
}

const space::Space &AleEnvironment::action_space() const {
  return action_space_;
}

ale::ALEInterface &AleEnvironment::get_interface() { return ale_; }

torch::Tensor AleEnvironment::get_observation() {
  size_t size = 1;
  for (auto dimension : observation_shape_)
    size *= static_cast<size_t>(dimension);
  ScreenBuffer screen(size);
  if (grayscale_)
    ale_.getScreenGrayscale(screen);
  else
    ale_.getScreenRGB(screen);
  return torch::from_blob(screen.data(), observation_shape_, torch::kUInt8)
      .clone();
}

} // namespace multistep::environment
