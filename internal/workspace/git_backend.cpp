#include "git_backend.hpp"

#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/file_io.hpp"

namespace coord::workspace {

namespace {

std::vector<std::string> SplitNul(const std::string& text) {
  std::vector<std::string> out;
  size_t                   start = 0;
  while (start < text.size()) {
    auto end = text.find('\0', start);
    if (end == std::string::npos) end = text.size();
    if (end > start) out.emplace_back(text.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

std::string Trim(std::string value) {
  while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' ')) value.pop_back();
  return value;
}

std::string Describe(const std::vector<std::string>& args) {
  std::string out = "git";
  for (const auto& arg : args) out += " " + arg;
  return out;
}

[[noreturn]] void ThrowGitError(const std::vector<std::string>& args, const util::CommandResult& result) {
  const auto message = Describe(args) + " exited " + std::to_string(result.exit_code) + ": " + Trim(result.err.empty() ? result.out : result.err);
  if (result.err.find("Permission denied") != std::string::npos) {
    throw util::PermissionDenied(message);
  }
  if (result.err.find("No space left") != std::string::npos) {
    throw util::DiskFull(message);
  }
  throw util::CoordError(util::ErrorKind::kUnknown, message);
}

} // namespace

GitCliBackend::GitCliBackend(GitOptions options) : options_(std::move(options)) {
}

const std::vector<std::string>& GitCliBackend::IdentityArgs() {
  std::call_once(identity_once_, [this] {
    const auto email = Run(options_.repository, {"config", "user.email"});
    if (email.Ok() && !Trim(email.out).empty()) {
      return;
    }
    identity_args_ = {"-c", "user.name=" + options_.commit_name, "-c", "user.email=" + options_.commit_email};
    COORD_LOG_DEBUG("git identity not configured; using fallback", {observability::StringField("email", options_.commit_email)});
  });
  return identity_args_;
}

util::CommandResult GitCliBackend::Run(const std::filesystem::path& checkout, const std::vector<std::string>& args, bool with_identity) {
  std::vector<std::string> argv = {options_.git_binary, "-C", checkout.string()};
  if (with_identity) {
    const auto& identity = IdentityArgs();
    argv.insert(argv.end(), identity.begin(), identity.end());
  }
  argv.insert(argv.end(), args.begin(), args.end());

  auto result = util::RunCommand(argv);
  COORD_LOG_DEBUG("git", {observability::StringField("args", Describe(args)), observability::IntField("exit", result.exit_code)});
  return result;
}

std::string GitCliBackend::RunChecked(const std::filesystem::path& checkout, const std::vector<std::string>& args, bool with_identity) {
  auto result = Run(checkout, args, with_identity);
  if (!result.Ok()) {
    ThrowGitError(args, result);
  }
  return result.out;
}

std::string GitCliBackend::ResolveCommit(const std::filesystem::path& checkout, const std::string& ref) {
  auto result = Run(checkout, {"rev-parse", "--verify", "--quiet", ref + "^{commit}"});
  if (!result.Ok()) {
    throw util::NotFound("unknown revision: " + ref);
  }
  return Trim(result.out);
}

std::string GitCliBackend::CurrentBranch(const std::filesystem::path& checkout) {
  auto result = Run(checkout, {"symbolic-ref", "--quiet", "--short", "HEAD"});
  return result.Ok() ? Trim(result.out) : std::string();
}

void GitCliBackend::AddWorktree(const std::filesystem::path& path, const std::string& branch, const std::string& base_commit) {
  util::EnsureDirectory(path.parent_path());
  RunChecked(options_.repository, {"worktree", "add", "-b", branch, path.string(), base_commit});
}

void GitCliBackend::RemoveWorktree(const std::filesystem::path& path, bool force) {
  std::vector<std::string> args = {"worktree", "remove"};
  if (force) args.push_back("--force");
  args.push_back(path.string());
  RunChecked(options_.repository, args);
}

void GitCliBackend::PruneWorktrees() {
  RunChecked(options_.repository, {"worktree", "prune"});
}

std::vector<WorktreeInfo> GitCliBackend::ListWorktrees() {
  const auto out = RunChecked(options_.repository, {"worktree", "list", "--porcelain"});

  std::vector<WorktreeInfo> worktrees;
  std::istringstream        in(out);
  std::string               line;
  WorktreeInfo              current;
  bool                      open = false;

  auto flush = [&] {
    if (open) worktrees.push_back(current);
    current = WorktreeInfo{};
    open    = false;
  };

  while (std::getline(in, line)) {
    if (line.empty()) {
      flush();
    } else if (line.rfind("worktree ", 0) == 0) {
      flush();
      current.path = std::filesystem::path(line.substr(9)).lexically_normal();
      open         = true;
    } else if (line.rfind("HEAD ", 0) == 0) {
      current.head = line.substr(5);
    } else if (line.rfind("branch refs/heads/", 0) == 0) {
      current.branch = line.substr(18);
    }
  }
  flush();
  return worktrees;
}

bool GitCliBackend::BranchExists(const std::string& branch) {
  return Run(options_.repository, {"show-ref", "--verify", "--quiet", "refs/heads/" + branch}).Ok();
}

void GitCliBackend::DeleteBranch(const std::string& branch) {
  RunChecked(options_.repository, {"branch", "-D", branch});
}

bool GitCliBackend::IsAncestor(const std::string& ancestor, const std::string& descendant) {
  const std::vector<std::string> args   = {"merge-base", "--is-ancestor", ancestor, descendant};
  auto                           result = Run(options_.repository, args);
  if (result.exit_code == 0) return true;
  if (result.exit_code == 1) return false;
  ThrowGitError(args, result);
}

std::vector<std::string> GitCliBackend::DirtyPaths(const std::filesystem::path& checkout, const std::vector<std::string>& excluded) {
  std::vector<std::string> args = {"status", "--porcelain=v1", "-z", "--untracked-files=all", "--", "."};
  for (const auto& prefix : excluded) {
    if (!prefix.empty()) args.push_back(":(exclude)" + prefix);
  }

  const auto records = SplitNul(RunChecked(checkout, args));

  std::vector<std::string> paths;
  for (size_t i = 0; i < records.size(); ++i) {
    const auto& record = records[i];
    if (record.size() < 4) continue;
    paths.push_back(record.substr(3));
    // Renames and copies carry the source path as the next record.
    if (record[0] == 'R' || record[0] == 'C') ++i;
  }
  return paths;
}

std::vector<std::string> GitCliBackend::ChangedPaths(const std::string& from, const std::string& to) {
  return SplitNul(RunChecked(options_.repository, {"diff", "--name-only", "-z", from, to, "--"}));
}

MergeOutcome GitCliBackend::Merge(const std::filesystem::path& checkout, const std::string& branch, coord::v1::MergeStrategy strategy,
                                  const std::string& message) {
  MergeOutcome outcome;

  switch (strategy) {
    case coord::v1::MERGE_STRATEGY_FAST_FORWARD: {
      auto result = Run(checkout, {"merge", "--ff-only", branch});
      if (!result.Ok()) {
        // Not fast-forwardable: trunk moved since the workspace branched.
        return outcome;
      }
      break;
    }

    case coord::v1::MERGE_STRATEGY_SQUASH: {
      const std::vector<std::string> args   = {"merge", "--squash", branch};
      auto                           result = Run(checkout, args, true);
      if (!result.Ok()) {
        outcome.conflicts = UnmergedPaths(checkout);
        RunChecked(checkout, {"reset", "--hard", "HEAD"});
        if (outcome.conflicts.empty()) ThrowGitError(args, result);
        return outcome;
      }
      // Nothing staged means the branch was already contained in trunk.
      if (!Run(checkout, {"diff", "--cached", "--quiet"}).Ok()) {
        Commit(checkout, message);
      }
      break;
    }

    default: {
      const std::vector<std::string> args   = {"merge", "--no-ff", "--no-edit", "-m", message, branch};
      auto                           result = Run(checkout, args, true);
      if (!result.Ok()) {
        outcome.conflicts = UnmergedPaths(checkout);
        if (MergeInProgress(checkout)) AbortMerge(checkout);
        if (outcome.conflicts.empty()) ThrowGitError(args, result);
        return outcome;
      }
      break;
    }
  }

  outcome.merged = true;
  outcome.commit = ResolveCommit(checkout, "HEAD");
  return outcome;
}

std::vector<std::string> GitCliBackend::BeginMerge(const std::filesystem::path& checkout, const std::string& ref, const std::string& message) {
  const std::vector<std::string> args   = {"merge", "--no-ff", "--no-commit", "-m", message, ref};
  auto                           result = Run(checkout, args, true);
  if (!result.Ok() && !MergeInProgress(checkout)) {
    ThrowGitError(args, result);
  }
  return UnmergedPaths(checkout);
}

bool GitCliBackend::MergeInProgress(const std::filesystem::path& checkout) {
  return Run(checkout, {"rev-parse", "-q", "--verify", "MERGE_HEAD"}).Ok();
}

std::vector<std::string> GitCliBackend::UnmergedPaths(const std::filesystem::path& checkout) {
  return SplitNul(RunChecked(checkout, {"diff", "--name-only", "--diff-filter=U", "-z"}));
}

void GitCliBackend::AbortMerge(const std::filesystem::path& checkout) {
  RunChecked(checkout, {"merge", "--abort"});
}

void GitCliBackend::TakeVersion(const std::filesystem::path& checkout, const std::string& ref, const std::string& path) {
  if (Run(checkout, {"checkout", ref, "--", path}).Ok()) {
    return;
  }
  // Absent in ref: the resolution is a deletion.
  RunChecked(checkout, {"rm", "-f", "-q", "--ignore-unmatch", "--", path});
}

void GitCliBackend::Stage(const std::filesystem::path& checkout, const std::string& path) {
  RunChecked(checkout, {"add", "-A", "--", path});
}

std::string GitCliBackend::Commit(const std::filesystem::path& checkout, const std::string& message) {
  RunChecked(checkout, {"commit", "--no-verify", "-m", message}, true);
  return ResolveCommit(checkout, "HEAD");
}

void GitCliBackend::Archive(const std::string& ref, const std::filesystem::path& output) {
  util::EnsureDirectory(output.parent_path());
  RunChecked(options_.repository, {"archive", "--format=tar.gz", "-o", output.string(), ref});
}

std::vector<coord::v1::ArchiveEntry> GitCliBackend::ListTree(const std::string& ref) {
  std::vector<coord::v1::ArchiveEntry> entries;
  for (const auto& record : SplitNul(RunChecked(options_.repository, {"ls-tree", "-r", "-l", "-z", ref}))) {
    // <mode> SP <type> SP <object> SP+ <size> TAB <path>
    const auto tab = record.find('\t');
    if (tab == std::string::npos) continue;

    std::istringstream meta(record.substr(0, tab));
    std::string        mode, type, object, size;
    meta >> mode >> type >> object >> size;

    coord::v1::ArchiveEntry entry;
    entry.set_path(record.substr(tab + 1));
    try {
      entry.set_size_bytes(size == "-" ? 0 : std::stoull(size));
    } catch (const std::exception&) {
      entry.set_size_bytes(0);
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

} // namespace coord::workspace
