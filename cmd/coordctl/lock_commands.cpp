#include <chrono>
#include <iostream>

#include <google/protobuf/struct.pb.h>

#include "commands.hpp"
#include "internal/cli/exit_codes.hpp"
#include "internal/util/process.hpp"
#include "internal/util/time.hpp"

namespace coord::cli {

namespace {

coord::v1::LockMode ParseMode(const std::string& value) {
  if (value == "exclusive") return coord::v1::LOCK_MODE_EXCLUSIVE;
  if (value == "shared") return coord::v1::LOCK_MODE_SHARED;
  throw UsageError("lock mode must be exclusive or shared: " + value);
}

coord::v1::LockRecord ToRecord(const lock::Lease& lease) {
  coord::v1::LockRecord record;
  record.set_resource_name(lease.resource);
  record.set_mode(lease.mode);
  record.set_holder_pid(lease.holder_pid);
  *record.mutable_acquired_at() = util::ToProto(lease.acquired_at);
  *record.mutable_expires_at()  = util::ToProto(lease.expires_at);
  record.set_lease_id(lease.lease_id);
  record.set_hostname(util::Hostname());
  return record;
}

void PrintTable(const std::vector<coord::v1::LockRecord>& records) {
  const auto now = static_cast<int64_t>(util::ToUnixMillis(util::Now()));
  std::cout << "RESOURCE\tMODE\tPID\tAGE_S\tLEASE\n";
  for (const auto& record : records) {
    const auto age = (now - static_cast<int64_t>(util::ToUnixMillis(util::FromProto(record.acquired_at())))) / 1000;
    std::cout << record.resource_name() << '\t' << lock::ToString(record.mode()) << '\t' << record.holder_pid() << '\t' << age << '\t'
              << record.lease_id() << '\n';
  }
}

} // namespace

int RunLockCommand(factory::Runtime& rt, const Args& args) {
  const auto& cmd = Arg(args, 0, "lock command");

  // The lock outlives this process: it is held on behalf of the invoking shell.
  if (cmd == "acquire") {
    const auto& resource = Arg(args, 1, "resource");

    std::optional<std::chrono::milliseconds> timeout;
    if (args.size() > 2) timeout = std::chrono::seconds(ParseInt(args[2], "timeoutSeconds"));
    const auto mode = ParseMode(ArgOr(args, 3, "exclusive"));

    auto lease = rt.locks->Acquire(resource, mode, timeout, {{"acquired_by", "coordctl"}}, util::ParentPid());
    Print(ToRecord(lease));
    return kExitOk;
  }

  if (cmd == "release") {
    const auto& resource = Arg(args, 1, "resource");
    rt.locks->ReleaseHeldBy(resource, util::ParentPid());
    Print(rt.locks->Check(resource));
    return kExitOk;
  }

  if (cmd == "check") {
    Print(rt.locks->Check(Arg(args, 1, "resource")));
    return kExitOk;
  }

  if (cmd == "list") {
    const auto format  = ArgOr(args, 1, "json");
    const auto records = rt.locks->List();
    if (format == "table") {
      PrintTable(records);
      return kExitOk;
    }
    if (format != "json") {
      throw UsageError("list format must be json or table: " + format);
    }
    coord::v1::LockList list;
    for (const auto& record : records) *list.add_locks() = record;
    Print(list);
    return kExitOk;
  }

  if (cmd == "cleanup") {
    std::optional<std::chrono::milliseconds> max_age;
    if (args.size() > 1) max_age = std::chrono::minutes(ParseInt(args[1], "maxAgeMinutes"));
    Print(rt.locks->Cleanup(max_age));
    return kExitOk;
  }

  if (cmd == "order") {
    if (args.size() < 2) {
      throw UsageError("missing argument: resource");
    }
    google::protobuf::Struct result;
    auto* order = (*result.mutable_fields())["order"].mutable_list_value();
    for (const auto& resource : rt.locks->SortByPriority({args.begin() + 1, args.end()})) {
      auto& entry = *order->add_values()->mutable_struct_value()->mutable_fields();
      entry["resource"].set_string_value(resource);
      entry["priority"].set_number_value(rt.locks->PriorityOf(resource));
    }
    Print(result);
    return kExitOk;
  }

  throw UsageError("unknown lock command: " + cmd);
}

} // namespace coord::cli
