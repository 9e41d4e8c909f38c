#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/process.hpp"
#include "vcs_backend.hpp"

namespace coord::workspace {

struct GitOptions {
  std::filesystem::path repository;
  std::string           git_binary = "git";

  // Used only when the repository has no user.email configured.
  std::string commit_name;
  std::string commit_email;
};

/*
  VcsBackend over the git command line. Every invocation runs as
  "git -C <checkout> ..." with stdout/stderr captured.
*/
class GitCliBackend final : public VcsBackend {
 public:
  explicit GitCliBackend(GitOptions options);

  std::string ResolveCommit(const std::filesystem::path& checkout, const std::string& ref) override;
  std::string CurrentBranch(const std::filesystem::path& checkout) override;

  void                      AddWorktree(const std::filesystem::path& path, const std::string& branch, const std::string& base_commit) override;
  void                      RemoveWorktree(const std::filesystem::path& path, bool force) override;
  void                      PruneWorktrees() override;
  std::vector<WorktreeInfo> ListWorktrees() override;

  bool BranchExists(const std::string& branch) override;
  void DeleteBranch(const std::string& branch) override;

  bool IsAncestor(const std::string& ancestor, const std::string& descendant) override;

  std::vector<std::string> DirtyPaths(const std::filesystem::path& checkout, const std::vector<std::string>& excluded) override;
  std::vector<std::string> ChangedPaths(const std::string& from, const std::string& to) override;

  MergeOutcome Merge(const std::filesystem::path& checkout, const std::string& branch, coord::v1::MergeStrategy strategy,
                     const std::string& message) override;

  std::vector<std::string> BeginMerge(const std::filesystem::path& checkout, const std::string& ref, const std::string& message) override;

  bool                     MergeInProgress(const std::filesystem::path& checkout) override;
  std::vector<std::string> UnmergedPaths(const std::filesystem::path& checkout) override;
  void                     AbortMerge(const std::filesystem::path& checkout) override;

  void TakeVersion(const std::filesystem::path& checkout, const std::string& ref, const std::string& path) override;
  void Stage(const std::filesystem::path& checkout, const std::string& path) override;

  std::string Commit(const std::filesystem::path& checkout, const std::string& message) override;

  void                                 Archive(const std::string& ref, const std::filesystem::path& output) override;
  std::vector<coord::v1::ArchiveEntry> ListTree(const std::string& ref) override;

 private:
  util::CommandResult Run(const std::filesystem::path& checkout, const std::vector<std::string>& args, bool with_identity = false);

  // Throws a CoordError carrying git's stderr on non-zero exit.
  std::string RunChecked(const std::filesystem::path& checkout, const std::vector<std::string>& args, bool with_identity = false);

  const std::vector<std::string>& IdentityArgs();

  GitOptions options_;

  std::once_flag           identity_once_;
  std::vector<std::string> identity_args_;
};

} // namespace coord::workspace
