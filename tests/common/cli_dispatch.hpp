#ifndef LFSPACK_TESTS_COMMON_CLI_DISPATCH_HPP_
#define LFSPACK_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "lfspack/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace lfspack::tests::common {

struct DispatchOutcome {
  int exit_code = -1;
  std::string out;
  std::string err;
};

// Swaps a stream buffer for the lifetime of the object.
class ScopedStreamCapture {
public:
  explicit ScopedStreamCapture(std::ostream& stream)
      : stream_(stream), previous_(stream.rdbuf(buffer_.rdbuf())) {}

  ~ScopedStreamCapture() {
    stream_.rdbuf(previous_);
  }

  ScopedStreamCapture(const ScopedStreamCapture&) = delete;
  ScopedStreamCapture& operator=(const ScopedStreamCapture&) = delete;

  std::string Text() const {
    return buffer_.str();
  }

private:
  std::ostream& stream_;
  std::ostringstream buffer_;
  std::streambuf* previous_ = nullptr;
};

// Runs `lfspack::cli::Dispatch` with stdout and stderr captured.
inline DispatchOutcome DispatchCaptured(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }

  DispatchOutcome outcome;
  ScopedStreamCapture out(std::cout);
  ScopedStreamCapture err(std::cerr);
  outcome.exit_code = lfspack::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
  outcome.out = out.Text();
  outcome.err = err.Text();
  return outcome;
}

} // namespace lfspack::tests::common

#endif // LFSPACK_TESTS_COMMON_CLI_DISPATCH_HPP_
