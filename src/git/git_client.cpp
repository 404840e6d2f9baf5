#include "git/git_client.hpp"

#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace lfspack::git {

namespace {

std::string TrimTrailingNewlines(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
  return text;
}

} // namespace

bool GitClient::Run(const std::vector<std::string>& args, std::string& output,
                    std::string& error) {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1U);
  argv.push_back("git");
  argv.insert(argv.end(), args.begin(), args.end());

  if (logger_ != nullptr) {
    logger_->Debug("running git", {{"command", core::process::FormatCommandLine(argv)}});
  }
  core::process::CommandResult result;
  const bool ok = core::process::RunChecked(runner_, argv, result, error);
  if (logger_ != nullptr && !result.error_output.empty()) {
    logger_->Debug("git stderr", {{"command", core::process::FormatCommandLine(argv)},
                                  {"stderr", TrimTrailingNewlines(result.error_output)}});
  }
  output = std::move(result.output);
  return ok;
}

bool GitClient::ShowTopLevel(fs::path& top_level, std::string& error) {
  std::string output;
  if (!Run({"rev-parse", "--show-toplevel"}, output, error)) {
    return false;
  }
  output = TrimTrailingNewlines(std::move(output));
  if (output.empty()) {
    error = "git did not report a work tree root";
    return false;
  }
  top_level = fs::path(output);
  return true;
}

bool GitClient::CurrentBranch(std::string& branch, std::string& error) {
  std::string output;
  if (!Run({"rev-parse", "--abbrev-ref", "HEAD"}, output, error)) {
    return false;
  }
  branch = TrimTrailingNewlines(std::move(output));
  if (branch.empty() || branch == "HEAD") {
    error = "HEAD is detached; check out a branch before packing";
    return false;
  }
  return true;
}

bool GitClient::IsWorktreeClean(bool& clean, std::string& error) {
  std::string output;
  if (!Run({"status", "--porcelain"}, output, error)) {
    return false;
  }
  clean = TrimTrailingNewlines(std::move(output)).empty();
  return true;
}

bool GitClient::BranchExists(const std::string& branch, bool& exists, std::string& error) {
  // `--verify --quiet` exits 1 without output when the ref is missing, so
  // this is the one git call where a non-zero exit is an answer.
  const std::vector<std::string> argv = {"git", "rev-parse", "--verify", "--quiet",
                                         "refs/heads/" + branch};
  if (logger_ != nullptr) {
    logger_->Debug("running git", {{"command", core::process::FormatCommandLine(argv)}});
  }
  core::process::CommandResult result;
  if (!runner_.Run(argv, result, error)) {
    return false;
  }
  if (result.exit_code == 0) {
    exists = true;
    return true;
  }
  if (result.exit_code == 1) {
    exists = false;
    return true;
  }
  error = "command '" + core::process::FormatCommandLine(argv) + "' exited with code " +
          std::to_string(result.exit_code);
  if (!result.error_output.empty()) {
    error += ": " + TrimTrailingNewlines(result.error_output);
  }
  return false;
}

bool GitClient::DeleteBranch(const std::string& branch, std::string& error) {
  std::string output;
  return Run({"branch", "-D", branch}, output, error);
}

bool GitClient::LfsFetchAll(std::string& error) {
  std::string output;
  return Run({"lfs", "fetch", "--all"}, output, error);
}

bool GitClient::LfsPrune(std::string& error) {
  std::string output;
  return Run({"lfs", "prune"}, output, error);
}

bool GitClient::LfsInstallLocal(std::string& error) {
  std::string output;
  return Run({"lfs", "install", "--local"}, output, error);
}

bool GitClient::LfsCheckout(std::string& error) {
  std::string output;
  return Run({"lfs", "checkout"}, output, error);
}

bool GitClient::CreateOrphanBranch(const std::string& branch, std::string& error) {
  std::string output;
  if (!Run({"checkout", "-q", "--orphan", branch}, output, error)) {
    return false;
  }
  return Run({"rm", "-r", "-f", "-q", "--ignore-unmatch", "."}, output, error);
}

bool GitClient::AddFiles(const std::vector<fs::path>& paths, std::string& error) {
  if (paths.empty()) {
    error = "no files to add";
    return false;
  }
  // `-f` keeps a repository-wide ignore rule from dropping generated files.
  std::vector<std::string> args = {"add", "-f", "--"};
  for (const auto& path : paths) {
    args.push_back(path.generic_string());
  }
  std::string output;
  return Run(args, output, error);
}

bool GitClient::Commit(const std::string& message, std::string& error) {
  std::string output;
  return Run({"commit", "-q", "-m", message}, output, error);
}

bool GitClient::PushBranch(const std::string& remote, const std::string& branch,
                           std::string& error) {
  std::string output;
  return Run({"push", "-f", "-u", remote, branch}, output, error);
}

bool GitClient::Checkout(const std::string& branch, bool force, std::string& error) {
  std::vector<std::string> args = {"checkout", "-q"};
  if (force) {
    args.push_back("-f");
  }
  args.push_back(branch);
  std::string output;
  return Run(args, output, error);
}

} // namespace lfspack::git
