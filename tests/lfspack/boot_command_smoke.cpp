#include "lfspack/cli/router.hpp"
#include "../common/assertions.hpp"
#include "../common/fake_command_runner.hpp"
#include "../common/store_fixtures.hpp"
#include "../common/temp_dir.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace {

using lfspack::tests::common::AssertTrue;
using lfspack::tests::common::FakeCommandRunner;
using lfspack::tests::common::Fail;

const std::vector<std::string> kShowTopLevel = {"git", "rev-parse", "--show-toplevel"};

void ScriptRepo(FakeCommandRunner& runner, const fs::path& top, std::string_view branch) {
  runner.Script(kShowTopLevel, 0, top.string() + "\n");
  runner.Script({"git", "rev-parse", "--abbrev-ref", "HEAD"}, 0, std::string(branch) + "\n");
  runner.Script({"git", "status", "--porcelain"}, 0, "");
  runner.Script({"git", "rev-parse", "--verify", "--quiet", "refs/heads/lfs-packed"}, 1, "");
}

lfspack::cli::BootCommandOptions QuietBoot(const fs::path& archives_dir) {
  lfspack::cli::BootCommandOptions options;
  options.archives_dir = archives_dir;
  options.log_level = lfspack::core::logging::LogLevel::kError;
  return options;
}

} // namespace

int main() {
  const fs::path root = fs::weakly_canonical(
      lfspack::tests::common::CreateUniqueTempDir("lfspack-boot-command"));
  const fs::path source = root / "source";
  const std::vector<std::uint64_t> sizes = {1200, 900, 3000, 64, 2500};
  lfspack::tests::common::WriteSampleStore(source / ".git" / "lfs", sizes);

  {
    lfspack::tests::common::ScopedCurrentPath cwd(source);
    FakeCommandRunner runner;
    ScriptRepo(runner, source, "release/2.0");
    lfspack::cli::PackCommandOptions options;
    options.max_bin_bytes = 4096;
    options.log_level = lfspack::core::logging::LogLevel::kError;
    if (lfspack::cli::ExecutePack(options, runner, nullptr) != 0) {
      Fail("pack should succeed");
    }
  }

  // Boot restores into the clone's store, then switches branches.
  const fs::path clone = root / "clone";
  fs::create_directories(clone);
  {
    lfspack::tests::common::ScopedCurrentPath cwd(clone);
    FakeCommandRunner runner;
    runner.Script(kShowTopLevel, 0, clone.string() + "\n");
    if (lfspack::cli::ExecuteBoot(QuietBoot(source), runner) != 0) {
      Fail("boot should succeed");
    }
    for (std::size_t i = 0; i < sizes.size(); ++i) {
      lfspack::tests::common::AssertSampleObjectRestored(clone / ".git" / "lfs", i, sizes[i]);
    }

    const auto& calls = runner.Calls();
    AssertTrue(calls.size() == 4U, "boot should run exactly four git commands");
    AssertTrue(calls[1] == "git lfs install --local", "lfs install should follow the restore");
    AssertTrue(calls[2] == "git checkout -q -f release/2.0", "boot should force the checkout");
    AssertTrue(calls[3] == "git lfs checkout", "lfs checkout should run last");

    // Booting again is harmless.
    FakeCommandRunner again;
    again.Script(kShowTopLevel, 0, clone.string() + "\n");
    if (lfspack::cli::ExecuteBoot(QuietBoot(source), again) != 0) {
      Fail("second boot should succeed");
    }
  }

  // A missing archive fails the boot before any branch switch.
  const fs::path broken = root / "broken";
  fs::create_directories(broken);
  fs::copy(source / "lfspack-manifest.json", broken / "lfspack-manifest.json");
  fs::copy(source / "lfspack-2.tar.gz", broken / "lfspack-2.tar.gz");
  const fs::path broken_clone = root / "broken-clone";
  fs::create_directories(broken_clone);
  {
    lfspack::tests::common::ScopedCurrentPath cwd(broken_clone);
    FakeCommandRunner runner;
    runner.Script(kShowTopLevel, 0, broken_clone.string() + "\n");
    if (lfspack::cli::ExecuteBoot(QuietBoot(broken), runner) != 1) {
      Fail("boot with a missing archive should exit 1");
    }
    AssertTrue(runner.CountCallsWithPrefix("git checkout") == 0U,
               "no checkout after a failed restore");
    AssertTrue(fs::exists(broken_clone / ".git" / "lfs" / "objects"),
               "objects from the surviving archive should be restored");
  }

  // No manifest means nothing to boot from.
  {
    FakeCommandRunner runner;
    runner.Script(kShowTopLevel, 0, clone.string() + "\n");
    if (lfspack::cli::ExecuteBoot(QuietBoot(root / "empty"), runner) != 1) {
      Fail("boot without a manifest should exit 1");
    }
    AssertTrue(runner.Calls().empty(), "no git command should run without a manifest");
  }

  lfspack::tests::common::RemovePathBestEffort(root);
  std::cout << "boot_command_smoke: ok\n";
  return 0;
}
