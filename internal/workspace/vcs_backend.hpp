#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "coord/v1/workspace.pb.h"

namespace coord::workspace {

struct WorktreeInfo {
  std::filesystem::path path;
  std::string           branch; // short name, empty when detached
  std::string           head;
};

struct MergeOutcome {
  bool                     merged = false;
  std::string              commit;
  std::vector<std::string> conflicts;
};

/*
  VcsBackend

  Version-control operations the workspace manager needs. Every call names the
  checkout it runs in; refs are resolved in that checkout.

  Failures throw CoordError subclasses; expected negative answers (not an
  ancestor, conflicts) are returned as values.
*/
class VcsBackend {
 public:
  virtual ~VcsBackend() = default;

  // Throws NotFound for unknown refs.
  virtual std::string ResolveCommit(const std::filesystem::path& checkout, const std::string& ref) = 0;

  virtual std::string CurrentBranch(const std::filesystem::path& checkout) = 0;

  virtual void                      AddWorktree(const std::filesystem::path& path, const std::string& branch, const std::string& base_commit) = 0;
  virtual void                      RemoveWorktree(const std::filesystem::path& path, bool force)                                             = 0;
  virtual void                      PruneWorktrees()                                                                                          = 0;
  virtual std::vector<WorktreeInfo> ListWorktrees()                                                                                           = 0;

  virtual bool BranchExists(const std::string& branch) = 0;
  virtual void DeleteBranch(const std::string& branch) = 0;

  virtual bool IsAncestor(const std::string& ancestor, const std::string& descendant) = 0;

  // Uncommitted changes including untracked files, minus excluded path prefixes.
  virtual std::vector<std::string> DirtyPaths(const std::filesystem::path& checkout, const std::vector<std::string>& excluded) = 0;

  // Paths that differ between two commits.
  virtual std::vector<std::string> ChangedPaths(const std::string& from, const std::string& to) = 0;

  // Integrates branch into the branch checked out at checkout. On conflict the
  // checkout is restored to its pre-merge state and the paths are returned.
  virtual MergeOutcome Merge(const std::filesystem::path& checkout, const std::string& branch, coord::v1::MergeStrategy strategy,
                             const std::string& message) = 0;

  // Starts a merge of ref into checkout without committing, leaving conflicts in place.
  virtual std::vector<std::string> BeginMerge(const std::filesystem::path& checkout, const std::string& ref, const std::string& message) = 0;

  virtual bool                     MergeInProgress(const std::filesystem::path& checkout) = 0;
  virtual std::vector<std::string> UnmergedPaths(const std::filesystem::path& checkout)   = 0;
  virtual void                     AbortMerge(const std::filesystem::path& checkout)      = 0;

  // Stages path as it exists in ref (removed when ref lacks it).
  virtual void TakeVersion(const std::filesystem::path& checkout, const std::string& ref, const std::string& path) = 0;
  virtual void Stage(const std::filesystem::path& checkout, const std::string& path)                              = 0;

  // Commits the index (including an in-progress merge); returns the new commit.
  virtual std::string Commit(const std::filesystem::path& checkout, const std::string& message) = 0;

  virtual void                                 Archive(const std::string& ref, const std::filesystem::path& output) = 0;
  virtual std::vector<coord::v1::ArchiveEntry> ListTree(const std::string& ref)                                     = 0;
};

} // namespace coord::workspace
