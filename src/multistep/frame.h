#pragma once
#include <map>
#include <string>
#include <torch/torch.h>
#include <utility>
#include <variant>
#include <vector>

namespace multistep {

// One observation. A plain tensor for box observation spaces, or an ordered
// list of named sub-frames mirroring a dict observation space.
class Frame {
public:
  typedef std::vector<std::pair<std::string, Frame>> Items;

  Frame() = default;
  Frame(torch::Tensor tensor);
  explicit Frame(Items items);

  bool is_tensor() const;
  const torch::Tensor &tensor() const;
  const Items &items() const;
  const Frame &at(const std::string &key) const;

private:
  std::variant<torch::Tensor, Items> value_;
};

// Auxiliary per-step values reported by an environment, keyed by name.
// Iteration follows sorted key order, not the order keys were first reported.
typedef std::map<std::string, torch::Tensor> Info;

} // namespace multistep
