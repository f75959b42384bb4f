#include "multistep/space.h"
#include "multistep/errors.h"
#include <set>
#include <type_traits>

namespace multistep::space {

std::vector<int64_t> Box::shape() const {
  const auto sizes = low.sizes();
  return std::vector<int64_t>(sizes.begin(), sizes.end());
}

Box Box::uniform(double low, double high, std::vector<int64_t> shape,
                 torch::Dtype dtype) {
  if (low > high)
    throw std::invalid_argument("Lower bound must not exceed upper bound.");
  auto options = torch::TensorOptions().dtype(dtype);
  return {torch::full(shape, low, options), torch::full(shape, high, options),
          dtype};
}

Dict::Dict(std::vector<std::pair<std::string, Space>> spaces)
    : spaces(std::move(spaces)) {
  std::set<std::string> keys;
  for (const auto &entry : this->spaces)
    if (!keys.insert(entry.first).second)
      throw std::invalid_argument("Duplicate key in dict space: " +
                                  entry.first);
}

const Space &Dict::at(const std::string &key) const {
  for (const auto &[name, space] : spaces)
    if (name == key)
      return space;
  throw std::out_of_range("Dict space has no key " + key + ".");
}

Space::Space(Box box) : value_(std::move(box)) {
  const auto &b = std::get<Box>(value_);
  if (!b.low.defined() || !b.high.defined())
    throw std::invalid_argument("Box bounds must be defined.");
  if (b.low.sizes() != b.high.sizes())
    throw std::invalid_argument("Box bounds must share the same shape.");
}

Space::Space(Discrete discrete) : value_(discrete) {
  if (discrete.n <= 0)
    throw std::invalid_argument("Discrete space must have n > 0.");
}

Space::Space(Dict dict) : value_(std::move(dict)) {}

bool Space::is_box() const { return std::holds_alternative<Box>(value_); }

bool Space::is_dict() const { return std::holds_alternative<Dict>(value_); }

const Box &Space::box() const {
  if (!is_box())
    throw std::invalid_argument("Space is a " + kind_name(*this) +
                                ", not a Box.");
  return std::get<Box>(value_);
}

const Dict &Space::dict() const {
  if (!is_dict())
    throw std::invalid_argument("Space is a " + kind_name(*this) +
                                ", not a Dict.");
  return std::get<Dict>(value_);
}

const Space::Value &Space::value() const { return value_; }

std::string kind_name(const Space &space) {
  switch (space.value().index()) {
  case 0:
    return "Box";
  case 1:
    return "Discrete";
  case 2:
    return "Dict";
  }
  return "Unknown";
}

namespace {

Box repeat_box(const Box &box, int64_t n,
               std::optional<torch::Dtype> box_dtype) {
  std::vector<int64_t> repeats(box.low.dim() + 1, 1);
  repeats[0] = n;
  const auto dtype = box_dtype.value_or(box.dtype);
  return {box.low.unsqueeze(0).repeat(repeats).to(dtype),
          box.high.unsqueeze(0).repeat(repeats).to(dtype), dtype};
}

} // namespace

Space repeat(const Space &space, int64_t n,
             std::optional<torch::Dtype> box_dtype) {
  if (n <= 0)
    throw std::invalid_argument("Repeat count must be greater than 0.");
  return std::visit(
      [&](const auto &value) -> Space {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Box>) {
          return repeat_box(value, n, box_dtype);
        } else if constexpr (std::is_same_v<T, Dict>) {
          std::vector<std::pair<std::string, Space>> spaces;
          spaces.reserve(value.spaces.size());
          for (const auto &[key, sub_space] : value.spaces)
            spaces.emplace_back(key, repeat(sub_space, n, box_dtype));
          return Dict(std::move(spaces));
        } else {
          throw UnsupportedSpaceKind(kind_name(space));
        }
      },
      space.value());
}

} // namespace multistep::space
