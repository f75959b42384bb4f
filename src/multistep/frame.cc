#include "multistep/frame.h"
#include <stdexcept>

namespace multistep {

Frame::Frame(torch::Tensor tensor) : value_(std::move(tensor)) {}

Frame::Frame(Items items) : value_(std::move(items)) {}

bool Frame::is_tensor() const {
  return std::holds_alternative<torch::Tensor>(value_);
}

const torch::Tensor &Frame::tensor() const {
  if (!is_tensor())
    throw std::invalid_argument("Frame holds named items, not a tensor.");
  return std::get<torch::Tensor>(value_);
}

const Frame::Items &Frame::items() const {
  if (is_tensor())
    throw std::invalid_argument("Frame holds a tensor, not named items.");
  return std::get<Items>(value_);
}

const Frame &Frame::at(const std::string &key) const {
  for (const auto &[name, frame] : items())
    if (name == key)
      return frame;
  throw std::out_of_range("Frame has no item named " + key + ".");
}

} // namespace multistep
