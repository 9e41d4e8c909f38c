#pragma once

#include <string>
#include <string_view>

#include "coord/v1/workspace.pb.h"
#include "internal/util/errors.hpp"

namespace coord::workspace {

using coord::v1::MergeStatus;
using coord::v1::MergeStrategy;
using coord::v1::WorkspaceStatus;

constexpr bool IsTerminal(WorkspaceStatus status) {
  return status == coord::v1::WORKSPACE_STATUS_ARCHIVED || status == coord::v1::WORKSPACE_STATUS_FAILED;
}

// A live record blocks creating another workspace with the same name.
constexpr bool IsLive(WorkspaceStatus status) {
  return !IsTerminal(status);
}

constexpr bool CanTransition(WorkspaceStatus from, WorkspaceStatus to) {
  switch (from) {
    case coord::v1::WORKSPACE_STATUS_ACTIVE:
      return to == coord::v1::WORKSPACE_STATUS_VALIDATING || to == coord::v1::WORKSPACE_STATUS_FAILED;
    case coord::v1::WORKSPACE_STATUS_VALIDATING:
      return to == coord::v1::WORKSPACE_STATUS_ACTIVE || to == coord::v1::WORKSPACE_STATUS_CONFLICT || to == coord::v1::WORKSPACE_STATUS_MERGED ||
             to == coord::v1::WORKSPACE_STATUS_FAILED;
    case coord::v1::WORKSPACE_STATUS_CONFLICT:
      return to == coord::v1::WORKSPACE_STATUS_ACTIVE || to == coord::v1::WORKSPACE_STATUS_FAILED;
    case coord::v1::WORKSPACE_STATUS_MERGED:
      return to == coord::v1::WORKSPACE_STATUS_ARCHIVED;
    default:
      return false;
  }
}

constexpr std::string_view ToString(WorkspaceStatus status) {
  switch (status) {
    case coord::v1::WORKSPACE_STATUS_ACTIVE:
      return "active";
    case coord::v1::WORKSPACE_STATUS_VALIDATING:
      return "validating";
    case coord::v1::WORKSPACE_STATUS_CONFLICT:
      return "conflict";
    case coord::v1::WORKSPACE_STATUS_MERGED:
      return "merged";
    case coord::v1::WORKSPACE_STATUS_ARCHIVED:
      return "archived";
    case coord::v1::WORKSPACE_STATUS_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(MergeStrategy strategy) {
  switch (strategy) {
    case coord::v1::MERGE_STRATEGY_FAST_FORWARD:
      return "fast-forward";
    case coord::v1::MERGE_STRATEGY_THREE_WAY:
      return "three-way";
    case coord::v1::MERGE_STRATEGY_SQUASH:
      return "squash";
    default:
      return "unspecified";
  }
}

// Throws ValidationFailed for unknown names.
inline WorkspaceStatus ParseStatus(const std::string& name) {
  for (auto status : {coord::v1::WORKSPACE_STATUS_ACTIVE, coord::v1::WORKSPACE_STATUS_VALIDATING, coord::v1::WORKSPACE_STATUS_CONFLICT,
                      coord::v1::WORKSPACE_STATUS_MERGED, coord::v1::WORKSPACE_STATUS_ARCHIVED, coord::v1::WORKSPACE_STATUS_FAILED}) {
    if (ToString(status) == name) return status;
  }
  throw util::ValidationFailed("unknown workspace status: " + name);
}

// Throws ValidationFailed for unknown names.
inline MergeStrategy ParseStrategy(const std::string& name) {
  if (name == "fast-forward" || name == "ff") return coord::v1::MERGE_STRATEGY_FAST_FORWARD;
  if (name == "three-way" || name == "merge") return coord::v1::MERGE_STRATEGY_THREE_WAY;
  if (name == "squash") return coord::v1::MERGE_STRATEGY_SQUASH;
  throw util::ValidationFailed("unknown merge strategy: " + name);
}

} // namespace coord::workspace
