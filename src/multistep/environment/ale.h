#pragma once
#include "multistep/environment/environment.h"
#include <ale/ale_interface.hpp>
#include <filesystem>
#include <vector>

namespace multistep::environment {

typedef std::vector<unsigned char> ScreenBuffer;

// Arcade Learning Environment game. Observations are uint8 screens of shape
// [height, width] (grayscale) or [height, width, 3] (RGB). Actions are scalar
// indices into the minimal action set.
class AleEnvironment : public VirtualEnvironment {
public:
  AleEnvironment(const std::filesystem::path &rom_path,
                 size_t max_num_frames_per_episode, bool grayscale, int seed);
  Frame reset(const ResetOptions &options) override;
  Step step(const Action &action) override;
  const space::Space &observation_space() const override;
  const space::Space &action_space() const override;
  ale::ALEInterface &get_interface();

private:
  const std::filesystem::path rom_path_;
  ale::ALEInterface ale_;
  const bool grayscale_;
  ale::ActionVect action_set_;
  std::vector<int64_t> observation_shape_;
  space::Space observation_space_;
  space::Space action_space_;
  torch::Tensor get_observation();
};

} // namespace multistep::environment
