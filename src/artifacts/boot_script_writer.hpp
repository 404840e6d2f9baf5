#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace lfspack::artifacts {

enum class ScriptFlavor {
  kPosixShell,
  kWindowsCmd,
};

// Values spliced into the boot templates. Rendered once, after packing.
struct BootScriptValues {
  std::string source_branch;
  std::uint64_t pack_count = 0;
};

const char* ScriptFileName(ScriptFlavor flavor);

// Raw template text with `{{source_branch}}` and `{{pack_count}}` slots.
std::string_view BootScriptTemplate(ScriptFlavor flavor);

// True when `name` only uses `[A-Za-z0-9._/-]`, does not start with '-' or
// '/', and has no `..` or `//`. Such names need no quoting in either shell.
bool IsSafeBranchName(std::string_view name);

// Replaces every `{{slot}}` in `text`. A slot without a value, or a value
// without a slot, is an error so templates and callers cannot drift apart.
bool RenderTemplate(std::string_view text, const std::map<std::string, std::string>& slots,
                    std::string& rendered, std::string& error);

// Renders one boot script. The Windows flavor uses CRLF line endings.
bool RenderBootScript(ScriptFlavor flavor, const BootScriptValues& values, std::string& rendered,
                      std::string& error);

// Writes `boot.sh` (marked executable) and `boot.cmd` into `output_dir`.
bool WriteBootScripts(const std::filesystem::path& output_dir, const BootScriptValues& values,
                      std::vector<std::filesystem::path>& written_paths, std::string& error);

} // namespace lfspack::artifacts
