#ifndef LFSPACK_TESTS_COMMON_FAKE_COMMAND_RUNNER_HPP_
#define LFSPACK_TESTS_COMMON_FAKE_COMMAND_RUNNER_HPP_

#include "core/process/command_runner.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace lfspack::tests::common {

// Records every command line and answers from a table keyed by the exact
// formatted command. Unscripted commands succeed with empty output.
class FakeCommandRunner final : public core::process::ICommandRunner {
public:
  void Script(const std::vector<std::string>& argv, int exit_code, std::string output = {},
              std::string error_output = {}) {
    responses_[core::process::FormatCommandLine(argv)] =
        core::process::CommandResult{exit_code, std::move(output), std::move(error_output)};
  }

  bool Run(const std::vector<std::string>& argv, core::process::CommandResult& result,
           std::string& error) override {
    (void)error;
    const std::string line = core::process::FormatCommandLine(argv);
    calls_.push_back(line);
    const auto it = responses_.find(line);
    result = it == responses_.end() ? core::process::CommandResult{0, {}, {}} : it->second;
    return true;
  }

  const std::vector<std::string>& Calls() const {
    return calls_;
  }

  bool WasCalled(const std::vector<std::string>& argv) const {
    const std::string line = core::process::FormatCommandLine(argv);
    for (const auto& call : calls_) {
      if (call == line) {
        return true;
      }
    }
    return false;
  }

  // Calls whose command line starts with `prefix`.
  std::size_t CountCallsWithPrefix(const std::string& prefix) const {
    std::size_t count = 0;
    for (const auto& call : calls_) {
      if (call.rfind(prefix, 0) == 0) {
        ++count;
      }
    }
    return count;
  }

private:
  std::map<std::string, core::process::CommandResult> responses_;
  std::vector<std::string> calls_;
};

} // namespace lfspack::tests::common

#endif // LFSPACK_TESTS_COMMON_FAKE_COMMAND_RUNNER_HPP_
