#pragma once

#include <cstdint>
#include <string_view>

namespace coord::recovery {

enum class OperationState : std::uint8_t {
  kAttempting = 0,
  kSucceeded  = 1,
  kFailed     = 2,
  kRetrying   = 3,
  kRestoring  = 4,
  kDegraded   = 5,
  kFatal      = 6,
};

constexpr bool IsTerminal(OperationState state) {
  return state == OperationState::kSucceeded || state == OperationState::kDegraded || state == OperationState::kFatal;
}

constexpr bool CanTransition(OperationState from, OperationState to) {
  if (IsTerminal(from)) {
    return false;
  }
  switch (from) {
    case OperationState::kAttempting:
      return to == OperationState::kSucceeded || to == OperationState::kFailed;
    case OperationState::kFailed:
      return to == OperationState::kRetrying || to == OperationState::kRestoring || to == OperationState::kDegraded || to == OperationState::kFatal;
    case OperationState::kRetrying:
      return to == OperationState::kAttempting || to == OperationState::kRestoring;
    case OperationState::kRestoring:
      return to == OperationState::kAttempting || to == OperationState::kFatal;
    default:
      return false;
  }
}

constexpr std::string_view ToString(OperationState state) {
  switch (state) {
    case OperationState::kAttempting:
      return "attempting";
    case OperationState::kSucceeded:
      return "succeeded";
    case OperationState::kFailed:
      return "failed";
    case OperationState::kRetrying:
      return "retrying";
    case OperationState::kRestoring:
      return "restoring";
    case OperationState::kDegraded:
      return "degraded";
    case OperationState::kFatal:
      return "fatal";
  }
  return "unknown";
}

} // namespace coord::recovery
