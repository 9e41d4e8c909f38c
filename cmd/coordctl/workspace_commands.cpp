#include "commands.hpp"
#include "internal/cli/exit_codes.hpp"
#include "internal/util/file_io.hpp"

namespace coord::cli {

namespace {

coord::v1::WorkspaceList ToList(const std::vector<coord::v1::WorkspaceRecord>& records) {
  coord::v1::WorkspaceList list;
  for (const auto& record : records) *list.add_workspaces() = record;
  return list;
}

// Splits "--flag value" pairs and bare "--switch"es from positional arguments.
struct Parsed {
  Args                     positional;
  std::vector<std::string> scope;
  std::vector<std::string> after;
  bool                     archive = false;
  bool                     force   = false;
  bool                     all     = false;
};

Parsed Parse(const Args& args) {
  Parsed out;
  for (size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg == "--scope") {
      out.scope.push_back(Arg(args, ++i, "--scope value"));
    } else if (arg == "--after") {
      out.after.push_back(Arg(args, ++i, "--after value"));
    } else if (arg == "--archive") {
      out.archive = true;
    } else if (arg == "--force") {
      out.force = true;
    } else if (arg == "--all") {
      out.all = true;
    } else if (arg.rfind("--", 0) == 0) {
      throw UsageError("unknown option: " + arg);
    } else {
      out.positional.push_back(arg);
    }
  }
  return out;
}

} // namespace

int RunWorkspaceCommand(factory::Runtime& rt, const Args& raw) {
  const auto  parsed = Parse(raw);
  const auto& args   = parsed.positional;
  const auto& cmd    = Arg(args, 0, "workspace command");
  auto&       ws     = *rt.workspaces;

  if (cmd == "create") {
    workspace::CreateOptions options;
    options.scope      = parsed.scope;
    options.depends_on = parsed.after;
    Print(ws.Create(Arg(args, 1, "taskKey"), ArgOr(args, 2, ""), options));
    return kExitOk;
  }

  if (cmd == "status") {
    if (args.size() > 1) {
      Print(ws.Get(args[1]));
    } else {
      workspace::ListFilter filter;
      filter.include_history = parsed.all;
      Print(ToList(ws.List(filter)));
    }
    return kExitOk;
  }

  if (cmd == "list") {
    workspace::ListFilter filter;
    filter.include_history = parsed.all;
    if (args.size() > 1) filter.status = workspace::ParseStatus(args[1]);
    Print(ToList(ws.List(filter)));
    return kExitOk;
  }

  if (cmd == "validate") {
    Print(ws.Validate(Arg(args, 1, "name")));
    return kExitOk;
  }

  if (cmd == "merge") {
    std::optional<workspace::MergeStrategy> strategy;
    if (args.size() > 2) strategy = workspace::ParseStrategy(args[2]);
    Print(ws.Merge(Arg(args, 1, "name"), strategy));
    return kExitOk;
  }

  if (cmd == "resolve") {
    const auto& name = Arg(args, 1, "name");
    const auto& path = Arg(args, 2, "path");
    const auto& how  = Arg(args, 3, "ours|theirs|file");
    if (how == "ours") {
      Print(ws.AcceptOurs(name, path));
    } else if (how == "theirs") {
      Print(ws.AcceptTheirs(name, path));
    } else if (how == "file") {
      Print(ws.ProvideResolved(name, path, util::ReadFile(Arg(args, 4, "source file"))));
    } else {
      throw UsageError("resolution must be ours, theirs or file: " + how);
    }
    return kExitOk;
  }

  if (cmd == "abort") {
    Print(ws.Abort(Arg(args, 1, "name")));
    return kExitOk;
  }

  if (cmd == "cleanup") {
    Print(ws.Cleanup(Arg(args, 1, "name"), parsed.archive, parsed.force));
    return kExitOk;
  }

  if (cmd == "repair") {
    Print(ws.Repair());
    return kExitOk;
  }

  throw UsageError("unknown workspace command: " + cmd);
}

} // namespace coord::cli
