#pragma once
#include <optional>
#include <string>
#include <torch/torch.h>
#include <utility>
#include <variant>
#include <vector>

namespace multistep::space {

// Bounded numeric array. `low` and `high` share the shape of the array.
struct Box {
  torch::Tensor low;
  torch::Tensor high;
  torch::Dtype dtype;

  std::vector<int64_t> shape() const;

  static Box uniform(double low, double high, std::vector<int64_t> shape,
                     torch::Dtype dtype);
};

// Finite set of integers {0, ..., n - 1}.
struct Discrete {
  int64_t n;
};

class Space;

// Ordered mapping of named sub-spaces. Keys must be unique.
struct Dict {
  Dict() = default;
  explicit Dict(std::vector<std::pair<std::string, Space>> spaces);

  const Space &at(const std::string &key) const;

  std::vector<std::pair<std::string, Space>> spaces;
};

class Space {
public:
  typedef std::variant<Box, Discrete, Dict> Value;

  Space(Box box);
  Space(Discrete discrete);
  Space(Dict dict);

  bool is_box() const;
  bool is_dict() const;
  const Box &box() const;
  const Dict &dict() const;
  const Value &value() const;

private:
  Value value_;
};

std::string kind_name(const Space &space);

// Describes `n` stacked copies of `space` along a new leading axis. Box
// spaces keep their dtype unless `box_dtype` overrides it.
Space repeat(const Space &space, int64_t n,
             std::optional<torch::Dtype> box_dtype = std::nullopt);

} // namespace multistep::space
