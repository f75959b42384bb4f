#include "multistep/frame_stack.h"
#include <algorithm>
#include <stdexcept>

namespace multistep::frame_stack {

torch::Tensor stack_last(const std::vector<torch::Tensor> &history, size_t n) {
  if (history.empty())
    throw std::invalid_argument("History must not be empty.");
  if (n == 0)
    throw std::invalid_argument("Frame stack must be greater than 0.");
  const auto dtype = history.front().dtype();
  for (const auto &frame : history)
    if (frame.dtype() != dtype)
      throw std::invalid_argument("All frames must share the same dtype.");

  const size_t count = std::min(history.size(), n);
  std::vector<torch::Tensor> frames(history.end() - count, history.end());
  const size_t pad = n - count;
  if (pad > 0) {
    const auto oldest = frames.front();
    frames.insert(frames.begin(), pad, oldest);
  }
  return torch::stack(frames, 0);
}

Frame stack_last(const std::vector<Frame> &history, size_t n) {
  if (history.empty())
    throw std::invalid_argument("History must not be empty.");
  if (history.front().is_tensor()) {
    std::vector<torch::Tensor> tensors;
    tensors.reserve(history.size());
    for (const auto &frame : history)
      tensors.push_back(frame.tensor());
    return stack_last(tensors, n);
  }
  Frame::Items items;
  for (const auto &item : history.front().items()) {
    const auto &key = item.first;
    std::vector<Frame> sub_history;
    sub_history.reserve(history.size());
    for (const auto &frame : history)
      sub_history.push_back(frame.at(key));
    items.emplace_back(key, stack_last(sub_history, n));
  }
  return Frame(std::move(items));
}

} // namespace multistep::frame_stack
