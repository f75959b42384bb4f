#pragma once
#include "multistep/frame.h"
#include <torch/torch.h>
#include <vector>

namespace multistep::frame_stack {

// Stacks the `n` most recent frames of `history` (oldest first) along a new
// leading axis. Short histories are left padded with copies of the oldest
// available frame, so the result always holds exactly `n` frames.
torch::Tensor stack_last(const std::vector<torch::Tensor> &history, size_t n);

// Same as above for structured frames, stacking each named item separately.
Frame stack_last(const std::vector<Frame> &history, size_t n);

} // namespace multistep::frame_stack
