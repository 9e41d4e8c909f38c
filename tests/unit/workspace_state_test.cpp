#include "internal/workspace/workspace_state.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"
#include "internal/workspace/workspace_manager.hpp"

namespace {

using namespace coord::workspace;

void TestLifecycleTransitions() {
  assert(CanTransition(coord::v1::WORKSPACE_STATUS_ACTIVE, coord::v1::WORKSPACE_STATUS_VALIDATING));
  assert(CanTransition(coord::v1::WORKSPACE_STATUS_VALIDATING, coord::v1::WORKSPACE_STATUS_MERGED));
  assert(CanTransition(coord::v1::WORKSPACE_STATUS_VALIDATING, coord::v1::WORKSPACE_STATUS_CONFLICT));
  assert(CanTransition(coord::v1::WORKSPACE_STATUS_CONFLICT, coord::v1::WORKSPACE_STATUS_ACTIVE));
  assert(CanTransition(coord::v1::WORKSPACE_STATUS_MERGED, coord::v1::WORKSPACE_STATUS_ARCHIVED));
  assert(CanTransition(coord::v1::WORKSPACE_STATUS_ACTIVE, coord::v1::WORKSPACE_STATUS_FAILED));

  assert(!CanTransition(coord::v1::WORKSPACE_STATUS_ACTIVE, coord::v1::WORKSPACE_STATUS_MERGED));
  assert(!CanTransition(coord::v1::WORKSPACE_STATUS_MERGED, coord::v1::WORKSPACE_STATUS_FAILED));
  assert(!CanTransition(coord::v1::WORKSPACE_STATUS_ARCHIVED, coord::v1::WORKSPACE_STATUS_ACTIVE));
  assert(!CanTransition(coord::v1::WORKSPACE_STATUS_FAILED, coord::v1::WORKSPACE_STATUS_ACTIVE));

  assert(IsTerminal(coord::v1::WORKSPACE_STATUS_ARCHIVED));
  assert(IsTerminal(coord::v1::WORKSPACE_STATUS_FAILED));
  assert(IsLive(coord::v1::WORKSPACE_STATUS_CONFLICT));
}

void TestStrategyAndStatusNames() {
  assert(ParseStrategy("ff") == coord::v1::MERGE_STRATEGY_FAST_FORWARD);
  assert(ParseStrategy("fast-forward") == coord::v1::MERGE_STRATEGY_FAST_FORWARD);
  assert(ParseStrategy("merge") == coord::v1::MERGE_STRATEGY_THREE_WAY);
  assert(ParseStrategy("squash") == coord::v1::MERGE_STRATEGY_SQUASH);
  assert(ToString(coord::v1::MERGE_STRATEGY_THREE_WAY) == "three-way");
  assert(ParseStatus("conflict") == coord::v1::WORKSPACE_STATUS_CONFLICT);

  bool threw = false;
  try {
    (void)ParseStrategy("octopus");
  } catch (const coord::util::ValidationFailed&) {
    threw = true;
  }
  assert(threw);
}

void TestNamesDeriveFromTaskKeys() {
  assert(WorkspaceManager::NameFor("phase1-task1") == "phase1-task1");
  assert(WorkspaceManager::NameFor("Phase 2 / Task #7") == "phase-2-task-7");
  assert(WorkspaceManager::NameFor("..hidden") == "hidden");

  bool threw = false;
  try {
    (void)WorkspaceManager::NameFor("///");
  } catch (const coord::util::ValidationFailed&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLifecycleTransitions();
  TestStrategyAndStatusNames();
  TestNamesDeriveFromTaskKeys();

  std::cout << "coord_unit_workspace_state: pass\n";
  return 0;
}
