#include <algorithm>
#include <chrono>

#include <google/protobuf/struct.pb.h>

#include "commands.hpp"
#include "internal/cli/exit_codes.hpp"
#include "internal/util/json.hpp"

namespace coord::cli {

namespace {

coord::v1::CheckpointSummary Summarize(const coord::v1::Checkpoint& checkpoint) {
  coord::v1::CheckpointSummary summary;
  summary.set_id(checkpoint.id());
  summary.set_name(checkpoint.name());
  summary.set_phase_at_capture(checkpoint.phase_at_capture());
  summary.set_kind(checkpoint.kind());
  *summary.mutable_created_at() = checkpoint.created_at();
  return summary;
}

coord::v1::SnapshotKind ParseKind(const std::string& value) {
  if (value == "full") return coord::v1::SNAPSHOT_KIND_FULL_STATE;
  if (value == "payload") return coord::v1::SNAPSHOT_KIND_PAYLOAD_ONLY;
  throw UsageError("checkpoint kind must be full or payload: " + value);
}

} // namespace

int RunRecoveryCommand(factory::Runtime& rt, const Args& args) {
  const auto& cmd = Arg(args, 0, "recovery command");

  if (cmd == "checkpoint") {
    const auto& name    = Arg(args, 1, "name");
    const auto& phase   = Arg(args, 2, "phase");
    auto        payload = util::ParseJsonAs<google::protobuf::Struct>(ReadInput(ArgOr(args, 3, "{}")));
    Print(Summarize(rt.recovery->Checkpoint(name, phase, payload, ParseKind(ArgOr(args, 4, "full")))));
    return kExitOk;
  }

  if (cmd == "restore") {
    Print(rt.recovery->Restore(Arg(args, 1, "checkpoint id")));
    return kExitOk;
  }

  if (cmd == "list-checkpoints") {
    coord::v1::CheckpointList list;
    for (const auto& checkpoint : rt.recovery->ListCheckpoints()) *list.add_checkpoints() = Summarize(checkpoint);
    Print(list);
    return kExitOk;
  }

  if (cmd == "cleanup-checkpoints") {
    std::optional<std::chrono::milliseconds> max_age;
    if (args.size() > 1) max_age = std::chrono::hours(24 * ParseInt(args[1], "days"));

    google::protobuf::Struct result;
    auto* removed = (*result.mutable_fields())["removed"].mutable_list_value();
    for (const auto& id : rt.recovery->PruneCheckpoints(max_age)) removed->add_values()->set_string_value(id);
    Print(result);
    return kExitOk;
  }

  if (cmd == "degrade") {
    const auto& reason = Arg(args, 1, "reason");
    rt.recovery->EnterDegradedMode(reason, {args.begin() + std::min<size_t>(2, args.size()), args.end()});
    Print(rt.recovery->Status());
    return kExitOk;
  }

  if (cmd == "recover-mode") {
    rt.recovery->ExitDegradedMode();
    Print(rt.recovery->Status());
    return kExitOk;
  }

  if (cmd == "status") {
    Print(rt.recovery->Status());
    return kExitOk;
  }

  throw UsageError("unknown recovery command: " + cmd);
}

} // namespace coord::cli
