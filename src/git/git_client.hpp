#pragma once

#include "core/logging/logger.hpp"
#include "core/process/command_runner.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace lfspack::git {

// Thin wrapper over the `git` / `git lfs` command lines lfspack depends on.
// Every call runs synchronously in the current working directory; a non-zero
// exit is returned as an error carrying the command and its last output line.
class GitClient {
public:
  explicit GitClient(core::process::ICommandRunner& runner,
                     core::logging::Logger* logger = nullptr)
      : runner_(runner), logger_(logger) {}

  // Absolute path of the enclosing work tree.
  bool ShowTopLevel(std::filesystem::path& top_level, std::string& error);

  // Name of the checked-out branch. A detached HEAD is an error.
  bool CurrentBranch(std::string& branch, std::string& error);

  // True when `git status --porcelain` reports nothing.
  bool IsWorktreeClean(bool& clean, std::string& error);

  bool BranchExists(const std::string& branch, bool& exists, std::string& error);
  bool DeleteBranch(const std::string& branch, std::string& error);

  bool LfsFetchAll(std::string& error);
  bool LfsPrune(std::string& error);
  bool LfsInstallLocal(std::string& error);
  bool LfsCheckout(std::string& error);

  // Switches to a new parentless branch and clears index and work tree of
  // tracked files so only generated artifacts get committed.
  bool CreateOrphanBranch(const std::string& branch, std::string& error);

  bool AddFiles(const std::vector<std::filesystem::path>& paths, std::string& error);
  bool Commit(const std::string& message, std::string& error);
  bool PushBranch(const std::string& remote, const std::string& branch, std::string& error);

  // `force` discards work-tree changes to tracked files.
  bool Checkout(const std::string& branch, bool force, std::string& error);

private:
  bool Run(const std::vector<std::string>& args, std::string& output, std::string& error);

  core::process::ICommandRunner& runner_;
  core::logging::Logger* logger_ = nullptr;
};

} // namespace lfspack::git
