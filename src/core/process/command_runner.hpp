#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lfspack::core::process {

// Captured outcome of one external command. Callers parse `output` (stdout)
// as data, so diagnostics on stderr are kept apart in `error_output`.
struct CommandResult {
  int exit_code = -1;
  std::string output;
  std::string error_output;
};

// Seam between lfspack workflows and the external tools they drive (git,
// git-lfs). Production code uses `ShellCommandRunner`; tests substitute a
// scripted runner so workflows can be exercised without a real repository.
class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;

  // Runs `argv[0]` with the remaining arguments and waits for completion.
  // Returns false only when the command could not be launched; a non-zero
  // exit is reported through `result.exit_code`.
  virtual bool Run(const std::vector<std::string>& argv, CommandResult& result,
                   std::string& error) = 0;
};

class ShellCommandRunner final : public ICommandRunner {
public:
  bool Run(const std::vector<std::string>& argv, CommandResult& result,
           std::string& error) override;
};

// Quotes one argument for the platform shell used by `ShellCommandRunner`.
std::string QuoteShellArgument(std::string_view arg);

// Human-readable rendering used in logs and error messages.
std::string FormatCommandLine(const std::vector<std::string>& argv);

// Runs a command and treats a non-zero exit as failure. The error message
// names the command, its exit code and the last line it wrote to stderr (or
// stdout when stderr was empty).
bool RunChecked(ICommandRunner& runner, const std::vector<std::string>& argv, std::string& output,
                std::string& error);
bool RunChecked(ICommandRunner& runner, const std::vector<std::string>& argv,
                CommandResult& result, std::string& error);

} // namespace lfspack::core::process
