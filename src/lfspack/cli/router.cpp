#include "lfspack/cli/router.hpp"

#include "artifacts/boot_script_writer.hpp"
#include "artifacts/pack_manifest.hpp"
#include "core/errors/exit_codes.hpp"
#include "git/git_client.hpp"
#include "store/object_store.hpp"
#include "unpack/unpacker.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace lfspack::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  lfspack pack [--branch <name>] [--max-bin-bytes <n>] [--no-fetch] [--no-push] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  lfspack plan [--store <dir>] [--max-bin-bytes <n>]\n"
      << "  lfspack unpack [--archives <dir>] [--store <dir>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  lfspack boot [--archives <dir>] [--log-level <debug|info|warn|error>]\n"
      << "  lfspack version\n"
      << "environment:\n"
      << "  " << kForceEnvVar << "=1  replace an existing packed branch\n";
}

struct PlanOptions {
  fs::path store_root = fs::path(store::kDefaultStoreDir);
  std::uint64_t max_bin_bytes = packing::kDefaultMaxBinBytes;
};

struct UnpackOptions {
  fs::path archives_dir = ".";
  fs::path store_root = fs::path(store::kDefaultStoreDir);
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

bool IsForceEnabled() {
  const char* raw = std::getenv(kForceEnvVar);
  return raw != nullptr && std::string_view(raw) == "1";
}

bool ParseByteCount(std::string_view raw, std::uint64_t& value, std::string& error) {
  std::uint64_t parsed = 0;
  const auto result = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (raw.empty() || result.ec != std::errc() || result.ptr != raw.data() + raw.size() ||
      parsed == 0U) {
    error = "--max-bin-bytes expects a positive integer, got '" + std::string(raw) + "'";
    return false;
  }
  value = parsed;
  return true;
}

// Shared handling for `--flag <value>` pairs. Returns nullopt and sets
// `error` when the value is missing.
std::optional<std::string_view> TakeValue(const std::vector<std::string_view>& args,
                                          std::size_t& i, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return std::nullopt;
  }
  ++i;
  return args[i];
}

bool ParseLogLevelFlag(const std::vector<std::string_view>& args, std::size_t& i,
                       core::logging::LogLevel& level, std::string& error) {
  const auto value = TakeValue(args, i, error);
  return value.has_value() && core::logging::ParseLogLevel(*value, level, error);
}

bool ParsePackOptions(const std::vector<std::string_view>& args, PackCommandOptions& options,
                      std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--no-fetch") {
      options.fetch = false;
      continue;
    }
    if (token == "--no-push") {
      options.push = false;
      continue;
    }
    if (token == "--branch") {
      const auto value = TakeValue(args, i, error);
      if (!value.has_value()) {
        return false;
      }
      options.packed_branch = std::string(*value);
      continue;
    }
    if (token == "--max-bin-bytes") {
      const auto value = TakeValue(args, i, error);
      if (!value.has_value() || !ParseByteCount(*value, options.max_bin_bytes, error)) {
        return false;
      }
      continue;
    }
    if (token == "--log-level") {
      if (!ParseLogLevelFlag(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }

    error = token.empty() || token.front() != '-' ? "pack does not accept positional arguments"
                                                  : "unknown option: " + std::string(token);
    return false;
  }

  options.force = IsForceEnabled();
  return true;
}

bool ParsePlanOptions(const std::vector<std::string_view>& args, PlanOptions& options,
                      std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--store") {
      const auto value = TakeValue(args, i, error);
      if (!value.has_value()) {
        return false;
      }
      options.store_root = fs::path(*value);
      continue;
    }
    if (token == "--max-bin-bytes") {
      const auto value = TakeValue(args, i, error);
      if (!value.has_value() || !ParseByteCount(*value, options.max_bin_bytes, error)) {
        return false;
      }
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }
  return true;
}

bool ParseUnpackOptions(const std::vector<std::string_view>& args, UnpackOptions& options,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--archives" || token == "--store") {
      const auto value = TakeValue(args, i, error);
      if (!value.has_value()) {
        return false;
      }
      (token == "--archives" ? options.archives_dir : options.store_root) = fs::path(*value);
      continue;
    }
    if (token == "--log-level") {
      if (!ParseLogLevelFlag(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }
  return true;
}

bool ParseBootOptions(const std::vector<std::string_view>& args, BootCommandOptions& options,
                      std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--archives") {
      const auto value = TakeValue(args, i, error);
      if (!value.has_value()) {
        return false;
      }
      options.archives_dir = fs::path(*value);
      continue;
    }
    if (token == "--log-level") {
      if (!ParseLogLevelFlag(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }
  return true;
}

int Fail(core::logging::Logger& logger, std::string_view message, const std::string& error) {
  logger.Error(message, {{"error", error}});
  std::cerr << "error: " << error << '\n';
  return kExitFailure;
}

bool IsSameDirectory(const fs::path& lhs, const fs::path& rhs) {
  std::error_code lhs_ec;
  std::error_code rhs_ec;
  const fs::path lhs_canonical = fs::weakly_canonical(lhs, lhs_ec);
  const fs::path rhs_canonical = fs::weakly_canonical(rhs, rhs_ec);
  if (lhs_ec || rhs_ec) {
    return false;
  }
  return lhs_canonical == rhs_canonical;
}

// Preconditions of `pack`, checked before any side effect. On success
// `source_branch` and `repo_root` are filled.
bool CheckPackPreconditions(const PackCommandOptions& options, git::GitClient& git,
                            fs::path& repo_root, std::string& source_branch, bool& replace_branch,
                            std::string& error) {
  replace_branch = false;

  std::error_code ec;
  const fs::path cwd = fs::current_path(ec);
  if (ec) {
    error = "failed to read current directory: " + ec.message();
    return false;
  }

  std::string git_error;
  if (!git.ShowTopLevel(repo_root, git_error) || !IsSameDirectory(repo_root, cwd)) {
    error = "lfspack pack must be run from the root of a git repository (cwd: " + cwd.string() +
            ")";
    return false;
  }
  repo_root = cwd;

  if (!artifacts::IsSafeBranchName(options.packed_branch)) {
    error = "invalid packed branch name: '" + options.packed_branch + "'";
    return false;
  }
  if (!git.CurrentBranch(source_branch, error)) {
    return false;
  }
  if (!artifacts::IsSafeBranchName(source_branch)) {
    error = "source branch name cannot be embedded in boot scripts: '" + source_branch + "'";
    return false;
  }
  if (source_branch == options.packed_branch) {
    error = "already on the packed branch '" + source_branch + "'; check out the source branch";
    return false;
  }

  bool clean = false;
  if (!git.IsWorktreeClean(clean, error)) {
    return false;
  }
  if (!clean) {
    error = "work tree has uncommitted changes; commit or stash them before packing";
    return false;
  }

  bool exists = false;
  if (!git.BranchExists(options.packed_branch, exists, error)) {
    return false;
  }
  if (exists && !options.force) {
    error = "branch '" + options.packed_branch + "' already exists (set " + kForceEnvVar +
            "=1 to replace it)";
    return false;
  }
  replace_branch = exists;
  return true;
}

bool ScanStoreIfPresent(const fs::path& store_root, core::logging::Logger& logger,
                        std::vector<store::ObjectEntry>& objects, std::string& error) {
  objects.clear();
  std::error_code ec;
  if (!fs::exists(store_root, ec) || ec) {
    logger.Warn("object store not found; nothing to pack", {{"store", store_root.string()}});
    return true;
  }

  store::ScanResult scan;
  if (!store::ScanObjectStore(store_root, scan, error)) {
    return false;
  }
  for (const auto& ignored : scan.ignored) {
    logger.Warn("ignoring file with unexpected name in object store",
                {{"path", ignored.string()}});
  }
  objects = std::move(scan.objects);
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "lfspack 0.1.0\n";
  return kExitSuccess;
}

int CommandPack(const std::vector<std::string_view>& args) {
  PackCommandOptions options;
  std::string error;
  if (!ParsePackOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::process::ShellCommandRunner runner;
  return ExecutePack(options, runner, nullptr);
}

int CommandPlan(const std::vector<std::string_view>& args) {
  PlanOptions options;
  std::string error;
  if (!ParsePlanOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  store::ScanResult scan;
  if (!store::ScanObjectStore(options.store_root, scan, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  packing::BinPlan plan;
  if (!packing::PlanBins(scan.objects, options.max_bin_bytes, plan, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  for (const auto& bin : plan.bins) {
    std::cout << pack::ArchiveFileName(bin.number) << ": " << bin.objects.size() << " objects, "
              << bin.payload_bytes << " bytes\n";
  }
  for (const auto& skipped : plan.skipped) {
    std::cout << "skipped: " << skipped.oid << " (" << skipped.size_bytes << " bytes)\n";
  }
  std::cout << "pack_count: " << plan.pack_count << '\n'
            << "archives: " << plan.bins.size() << '\n';
  return kExitSuccess;
}

int CommandUnpack(const std::vector<std::string_view>& args) {
  UnpackOptions options;
  std::string error;
  if (!ParseUnpackOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetOperation("unpack");
  logger.Info("unpack requested", {{"archives_dir", options.archives_dir.string()},
                                   {"store", options.store_root.string()}});

  std::vector<fs::path> archives;
  if (!unpack::FindPackArchives(options.archives_dir, archives, error)) {
    return Fail(logger, "failed to list archives", error);
  }

  unpack::UnpackResult result;
  const bool ok = unpack::UnpackArchives(archives, options.store_root, &logger, result, error);
  std::cout << "restored " << result.restored << " objects (" << result.already_present
            << " already present) from " << result.archives_total << " archives\n";
  if (!ok) {
    return Fail(logger, "unpack failed", error);
  }
  return kExitSuccess;
}

int CommandBoot(const std::vector<std::string_view>& args) {
  BootCommandOptions options;
  std::string error;
  if (!ParseBootOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::process::ShellCommandRunner runner;
  return ExecuteBoot(options, runner);
}

} // namespace

int ExecutePack(const PackCommandOptions& options, core::process::ICommandRunner& runner,
                PackCommandResult* pack_result) {
  core::logging::Logger logger(options.log_level);
  logger.SetOperation("pack");
  git::GitClient git(runner, &logger);

  if (pack_result != nullptr) {
    *pack_result = PackCommandResult{};
  }

  logger.Info("pack requested",
              {{"packed_branch", options.packed_branch},
               {"max_bin_bytes", options.max_bin_bytes},
               {"fetch", options.fetch ? "true" : "false"},
               {"push", options.push ? "true" : "false"},
               {"force", options.force ? "true" : "false"}});

  std::string error;
  fs::path repo_root;
  std::string source_branch;
  bool replace_branch = false;
  if (!CheckPackPreconditions(options, git, repo_root, source_branch, replace_branch, error)) {
    return Fail(logger, "pack precondition failed", error);
  }
  logger.Info("preconditions satisfied",
              {{"repo_root", repo_root.string()}, {"source_branch", source_branch}});

  if (replace_branch) {
    logger.Warn("replacing existing packed branch", {{"branch", options.packed_branch}});
    if (!git.DeleteBranch(options.packed_branch, error)) {
      return Fail(logger, "failed to delete existing packed branch", error);
    }
  }

  if (options.fetch) {
    if (!git.LfsFetchAll(error)) {
      return Fail(logger, "git lfs fetch failed", error);
    }
    if (!git.LfsPrune(error)) {
      return Fail(logger, "git lfs prune failed", error);
    }
  }

  const fs::path store_root = repo_root / fs::path(store::kDefaultStoreDir);
  std::vector<store::ObjectEntry> objects;
  if (!ScanStoreIfPresent(store_root, logger, objects, error)) {
    return Fail(logger, "failed to scan object store", error);
  }
  logger.Info("object store scanned", {{"objects", objects.size()}});

  if (!git.CreateOrphanBranch(options.packed_branch, error)) {
    return Fail(logger, "failed to create packed branch", error);
  }

  pack::PackOptions pack_options;
  pack_options.output_dir = repo_root;
  pack_options.max_bin_bytes = options.max_bin_bytes;
  pack_options.logger = &logger;
  pack::PackResult packed;
  if (!pack::PackObjects(objects, pack_options, packed, error)) {
    return Fail(logger, "packing failed", error);
  }

  std::vector<fs::path> committed;
  for (const auto& archive : packed.archives) {
    committed.push_back(archive.path.filename());
  }

  fs::path manifest_path;
  if (!artifacts::WritePackManifest(repo_root,
                                    artifacts::BuildPackManifest(packed, source_branch),
                                    manifest_path, error)) {
    return Fail(logger, "failed to write pack manifest", error);
  }
  committed.push_back(manifest_path.filename());

  std::vector<fs::path> script_paths;
  const artifacts::BootScriptValues values{source_branch, packed.pack_count};
  if (!artifacts::WriteBootScripts(repo_root, values, script_paths, error)) {
    return Fail(logger, "failed to write boot scripts", error);
  }
  for (const auto& path : script_paths) {
    committed.push_back(path.filename());
  }

  const std::string message = "lfspack: pack " + std::to_string(packed.pack_count) +
                              " LFS objects from " + source_branch;
  if (!git.AddFiles(committed, error) || !git.Commit(message, error)) {
    return Fail(logger, "failed to commit packed branch", error);
  }
  if (options.push && !git.PushBranch(options.remote, options.packed_branch, error)) {
    return Fail(logger, "failed to push packed branch", error);
  }

  if (!git.Checkout(source_branch, false, error)) {
    return Fail(logger, "failed to return to source branch", error);
  }

  logger.Info("pack completed",
              {{"pack_count", packed.pack_count},
               {"archives", packed.archives.size()},
               {"skipped", packed.skipped.size()}});
  std::cout << "packed " << packed.pack_count << " objects into " << packed.archives.size()
            << " archives on branch '" << options.packed_branch << "'";
  if (!packed.skipped.empty()) {
    std::cout << " (" << packed.skipped.size() << " oversized objects left unpacked)";
  }
  std::cout << '\n';

  if (pack_result != nullptr) {
    pack_result->source_branch = source_branch;
    pack_result->pack = std::move(packed);
    pack_result->committed_files = std::move(committed);
  }
  return kExitSuccess;
}

int ExecuteBoot(const BootCommandOptions& options, core::process::ICommandRunner& runner) {
  core::logging::Logger logger(options.log_level);
  logger.SetOperation("boot");
  git::GitClient git(runner, &logger);

  std::string error;
  artifacts::PackManifest manifest;
  if (!artifacts::LoadPackManifest(options.archives_dir / std::string(artifacts::kManifestFileName),
                                   manifest, error)) {
    return Fail(logger, "failed to load pack manifest", error);
  }
  if (!artifacts::IsSafeBranchName(manifest.source_branch)) {
    return Fail(logger, "invalid manifest",
                "manifest source branch is not a valid branch name: '" + manifest.source_branch +
                    "'");
  }

  fs::path repo_root;
  if (!git.ShowTopLevel(repo_root, error)) {
    return Fail(logger, "boot must run inside the packed repository", error);
  }

  std::vector<fs::path> archives;
  archives.reserve(manifest.archives.size());
  for (const auto& archive : manifest.archives) {
    if (!unpack::ParseArchiveNumber(archive.name).has_value()) {
      return Fail(logger, "invalid manifest", "unexpected archive name: '" + archive.name + "'");
    }
    archives.push_back(options.archives_dir / archive.name);
  }

  logger.Info("boot requested",
              {{"source_branch", manifest.source_branch},
               {"archives", archives.size()},
               {"pack_count", manifest.pack_count}});

  unpack::UnpackResult result;
  const fs::path store_root = repo_root / fs::path(store::kDefaultStoreDir);
  if (!unpack::UnpackArchives(archives, store_root, &logger, result, error)) {
    return Fail(logger, "archive restoration failed", error);
  }

  if (!git.LfsInstallLocal(error)) {
    return Fail(logger, "git lfs install failed", error);
  }
  if (!git.Checkout(manifest.source_branch, true, error)) {
    return Fail(logger, "failed to check out source branch", error);
  }
  if (!git.LfsCheckout(error)) {
    return Fail(logger, "git lfs checkout failed", error);
  }

  std::cout << "restored " << result.ObjectsAvailable() << " of " << manifest.pack_count
            << " objects; now on " << manifest.source_branch << '\n';
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "pack") {
    return CommandPack(args);
  }
  if (command == "plan") {
    return CommandPlan(args);
  }
  if (command == "unpack") {
    return CommandUnpack(args);
  }
  if (command == "boot") {
    return CommandBoot(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace lfspack::cli
