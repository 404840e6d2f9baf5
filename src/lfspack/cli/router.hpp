#pragma once

#include "core/logging/logger.hpp"
#include "core/process/command_runner.hpp"
#include "pack/packer.hpp"
#include "packing/bin_planner.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace lfspack::cli {

inline constexpr std::string_view kDefaultPackedBranch = "lfs-packed";
inline constexpr std::string_view kDefaultRemote = "origin";
// Set to "1" to replace an existing packed branch instead of refusing to run.
inline constexpr const char* kForceEnvVar = "LFSPACK_FORCE";

struct PackCommandOptions {
  std::string packed_branch = std::string(kDefaultPackedBranch);
  std::string remote = std::string(kDefaultRemote);
  std::uint64_t max_bin_bytes = packing::kDefaultMaxBinBytes;
  bool fetch = true;
  bool push = true;
  bool force = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// What a pack run produced, for callers chaining follow-up steps in-process.
struct PackCommandResult {
  std::string source_branch;
  pack::PackResult pack;
  std::vector<std::filesystem::path> committed_files;
};

struct BootCommandOptions {
  std::filesystem::path archives_dir = ".";
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Full pack workflow against the repository in the current directory:
// preconditions, LFS fetch/prune, orphan branch, archives, manifest, boot
// scripts, commit, push, return to the source branch.
//
// All precondition failures are reported before anything is modified.
// Failures after the orphan branch is created are not rolled back.
int ExecutePack(const PackCommandOptions& options, core::process::ICommandRunner& runner,
                PackCommandResult* pack_result);

// Native equivalent of the generated boot scripts.
int ExecuteBoot(const BootCommandOptions& options, core::process::ICommandRunner& runner);

// Routes `lfspack` subcommands. Exit codes:
//   0 => success
//   1 => precondition, external tool, I/O or restoration failure
//   2 => usage error (unknown command / invalid args)
int Dispatch(int argc, char** argv);

} // namespace lfspack::cli
