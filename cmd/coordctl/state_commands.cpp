#include <google/protobuf/struct.pb.h>

#include "commands.hpp"
#include "internal/cli/exit_codes.hpp"
#include "internal/util/file_io.hpp"
#include "internal/util/json.hpp"

namespace coord::cli {

namespace {

int PrintRead(const state::StateReadOutcome& outcome) {
  coord::v1::ReadResult result;
  *result.mutable_document() = outcome.document;
  result.set_recovered(outcome.recovered);
  result.set_recovered_from(outcome.recovered_from);
  Print(result);
  return outcome.recovered ? kExitRecovered : kExitOk;
}

coord::v1::BackupList ToBackupList(const std::vector<coord::v1::BackupInfo>& backups) {
  coord::v1::BackupList list;
  for (const auto& backup : backups) *list.add_backups() = backup;
  return list;
}

} // namespace

int RunStateCommand(factory::Runtime& rt, const Args& args) {
  const auto& cmd = Arg(args, 0, "state command");

  if (cmd == "init") {
    return PrintRead(rt.state->Init());
  }

  if (cmd == "read") {
    return PrintRead(rt.state->Read());
  }

  if (cmd == "write") {
    const auto patch = ReadInput(Arg(args, 1, "patch-json"));
    Print(rt.state->ApplyPatch(patch, ArgOr(args, 2, "")));
    return kExitOk;
  }

  // Checks the file as it is on disk; never repairs.
  if (cmd == "validate") {
    const auto& file = rt.state->Options().file;
    auto        doc  = util::ParseJsonAs<coord::v1::StateDocument>(util::ReadFile(file));
    rt.state->Validate(doc);

    coord::v1::ValidationReport report;
    report.set_ok(true);
    report.set_message(file.string() + " is valid (version " + std::to_string(doc.version()) + ", phase " + doc.phase() + ")");
    Print(report);
    return kExitOk;
  }

  if (cmd == "backup") {
    Print(rt.state->Backup(ArgOr(args, 1, "manual")));
    return kExitOk;
  }

  if (cmd == "restore") {
    Print(rt.state->Restore(ArgOr(args, 1, "")));
    return kExitOk;
  }

  if (cmd == "status") {
    Print(rt.state->Status());
    return kExitOk;
  }

  if (cmd == "migrate") {
    google::protobuf::Struct result;
    (*result.mutable_fields())["migrated"].set_bool_value(rt.state->Migrate());
    Print(result);
    return kExitOk;
  }

  if (cmd == "backups") {
    Print(ToBackupList(rt.state->ListBackups()));
    return kExitOk;
  }

  if (cmd == "prune-backups") {
    google::protobuf::Struct result;
    auto*                    removed = (*result.mutable_fields())["removed"].mutable_list_value();
    for (const auto& id : rt.state->PruneBackups()) removed->add_values()->set_string_value(id);
    Print(result);
    return kExitOk;
  }

  throw UsageError("unknown state command: " + cmd);
}

} // namespace coord::cli
