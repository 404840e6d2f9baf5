#include "core/process/command_runner.hpp"

#include "core/fs_utils.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace lfspack::core::process {

namespace {

std::string LastNonEmptyLine(std::string_view text) {
  std::size_t end = text.size();
  while (end > 0U && (text[end - 1] == '\n' || text[end - 1] == '\r')) {
    --end;
  }
  const std::string_view trimmed = text.substr(0, end);
  const std::size_t newline = trimmed.rfind('\n');
  if (newline == std::string_view::npos) {
    return std::string(trimmed);
  }
  return std::string(trimmed.substr(newline + 1));
}

// stderr is redirected into a scratch file because popen only exposes one
// stream.
std::filesystem::path MakeStderrCapturePath(std::string& error) {
  std::error_code ec;
  const std::filesystem::path temp_dir = std::filesystem::temp_directory_path(ec);
  if (ec) {
    error = "failed to resolve temp directory: " + ec.message();
    return {};
  }
  return core::MakeAtomicTempPath(temp_dir / "lfspack-stderr");
}

std::string ReadAndRemoveCapture(const std::filesystem::path& path) {
  std::string text;
  {
    std::ifstream input(path, std::ios::binary);
    if (input) {
      text.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    }
  }
  std::error_code ec;
  std::filesystem::remove(path, ec);
  return text;
}

} // namespace

std::string QuoteShellArgument(std::string_view arg) {
#if defined(_WIN32)
  std::string quoted = "\"";
  for (const char c : arg) {
    if (c == '"') {
      quoted += "\\\"";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('"');
  return quoted;
#else
  std::string quoted = "'";
  for (const char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
#endif
}

std::string FormatCommandLine(const std::vector<std::string>& argv) {
  std::string line;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i != 0U) {
      line.push_back(' ');
    }
    line += argv[i];
  }
  return line;
}

bool ShellCommandRunner::Run(const std::vector<std::string>& argv, CommandResult& result,
                             std::string& error) {
  result = CommandResult{};
  error.clear();

  if (argv.empty()) {
    error = "command line cannot be empty";
    return false;
  }

  std::string command;
  for (const auto& arg : argv) {
    if (!command.empty()) {
      command.push_back(' ');
    }
    command += QuoteShellArgument(arg);
  }
  const std::filesystem::path stderr_path = MakeStderrCapturePath(error);
  if (stderr_path.empty()) {
    return false;
  }
  command += " 2>" + QuoteShellArgument(stderr_path.string());

#if defined(_WIN32)
  FILE* pipe = _popen(command.c_str(), "r");
#else
  FILE* pipe = popen(command.c_str(), "r");
#endif
  if (pipe == nullptr) {
    error = "failed to execute command: " + FormatCommandLine(argv);
    std::error_code ec;
    std::filesystem::remove(stderr_path, ec);
    return false;
  }

  char buffer[4096];
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), pipe) != nullptr) {
    result.output.append(buffer);
  }

#if defined(_WIN32)
  const int raw_status = _pclose(pipe);
  result.error_output = ReadAndRemoveCapture(stderr_path);
  result.exit_code = raw_status;
#else
  const int raw_status = pclose(pipe);
  result.error_output = ReadAndRemoveCapture(stderr_path);
  if (raw_status == -1) {
    error = "failed to collect exit status for command: " + FormatCommandLine(argv);
    return false;
  }
  if (WIFEXITED(raw_status)) {
    result.exit_code = WEXITSTATUS(raw_status);
  } else {
    result.exit_code = raw_status;
  }
#endif

  return true;
}

bool RunChecked(ICommandRunner& runner, const std::vector<std::string>& argv, std::string& output,
                std::string& error) {
  CommandResult result;
  const bool ok = RunChecked(runner, argv, result, error);
  output = std::move(result.output);
  return ok;
}

bool RunChecked(ICommandRunner& runner, const std::vector<std::string>& argv,
                CommandResult& result, std::string& error) {
  if (!runner.Run(argv, result, error)) {
    return false;
  }
  if (result.exit_code != 0) {
    error = "command '" + FormatCommandLine(argv) + "' exited with code " +
            std::to_string(result.exit_code);
    std::string detail = LastNonEmptyLine(result.error_output);
    if (detail.empty()) {
      detail = LastNonEmptyLine(result.output);
    }
    if (!detail.empty()) {
      error += ": " + detail;
    }
    return false;
  }
  return true;
}

} // namespace lfspack::core::process
