#pragma once
#include <stdexcept>
#include <string>

namespace multistep {

class UnsupportedSpaceKind : public std::invalid_argument {
public:
  explicit UnsupportedSpaceKind(const std::string &kind)
      : std::invalid_argument("Unsupported space kind: " + kind) {}
};

class UnsupportedReduction : public std::invalid_argument {
public:
  explicit UnsupportedReduction(const std::string &mode)
      : std::invalid_argument("Unsupported reduction: " + mode) {}
};

class ActionCountMismatch : public std::invalid_argument {
public:
  ActionCountMismatch(size_t expected, size_t actual)
      : std::invalid_argument("Expected " + std::to_string(expected) +
                              " actions but got " + std::to_string(actual) +
                              ".") {}
};

// Raised when a reduction is requested before any inner step was recorded.
class EmptyReductionInput : public std::logic_error {
public:
  EmptyReductionInput()
      : std::logic_error("Cannot reduce an empty sequence of rewards.") {}
};

} // namespace multistep
