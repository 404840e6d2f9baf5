#pragma once

namespace lfspack::core::errors {

// Process-exit contract shared by every lfspack subcommand.
//
// - 0 success
// - 1 precondition, external tool, I/O or restoration failure
// - 2 usage/argument failure
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace lfspack::core::errors
