#include "artifacts/boot_script_writer.hpp"

#include "core/fs_utils.hpp"

#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace lfspack::artifacts {

namespace {

constexpr std::string_view kSlotOpen = "{{";
constexpr std::string_view kSlotClose = "}}";

constexpr std::string_view kPosixTemplate = R"(#!/bin/sh
# Restores {{pack_count}} Git LFS objects packed from branch '{{source_branch}}'.
# Generated by lfspack. Run from the repository root with this branch checked out.
set -eu

branch='{{source_branch}}'
lfs=.git/lfs

if [ ! -d .git ]; then
  echo "error: run boot.sh from the repository root" >&2
  exit 1
fi

# Each archive is unpacked into a staging directory inside the store; its
# objects are renamed into objects/ only after tar succeeds.
mkdir -p "$lfs/objects" "$lfs/tmp"
stage="$lfs/tmp/lfspack-stage.$$"
failed=0
for archive in lfspack-*.tar.gz; do
  [ -e "$archive" ] || continue
  echo "extracting $archive"
  rm -rf "$stage"
  mkdir -p "$stage"
  if ! tar -xzf "$archive" -C "$stage"; then
    echo "error: failed to extract $archive" >&2
    rm -rf "$stage"
    failed=1
    continue
  fi
  if [ -d "$stage/objects" ]; then
    (cd "$stage" && find objects -type f) | while IFS= read -r object; do
      mkdir -p "$lfs/${object%/*}"
      mv -f "$stage/$object" "$lfs/$object"
    done
  fi
  rm -rf "$stage"
done

if [ "$failed" -ne 0 ]; then
  echo "error: some archives could not be extracted; $branch was not checked out" >&2
  exit 1
fi

git lfs install --local
git checkout -f "$branch"
git lfs checkout
echo "restored {{pack_count}} objects; now on $branch"
)";

constexpr std::string_view kWindowsTemplate = R"(@echo off
rem Restores {{pack_count}} Git LFS objects packed from branch '{{source_branch}}'.
rem Generated by lfspack. Run from the repository root with this branch checked out.
setlocal
set "BRANCH={{source_branch}}"
set "LFS=.git\lfs"
set "STAGE=.git\lfs\tmp\lfspack-stage"
set "FAILED=0"

if not exist .git\ (
  echo error: run boot.cmd from the repository root 1>&2
  exit /b 1
)

if not exist "%LFS%\objects" mkdir "%LFS%\objects"
if not exist "%LFS%\tmp" mkdir "%LFS%\tmp"
for %%A in (lfspack-*.tar.gz) do call :extract "%%A"
if not "%FAILED%"=="0" (
  echo error: some archives could not be extracted; %BRANCH% was not checked out 1>&2
  exit /b 1
)

git lfs install --local || exit /b 1
git checkout -f "%BRANCH%" || exit /b 1
git lfs checkout || exit /b 1
echo restored {{pack_count}} objects; now on %BRANCH%
endlocal
exit /b 0

rem Unpacks one archive into the staging directory, then renames its objects
rem into the store.
:extract
if exist "%STAGE%" rmdir /s /q "%STAGE%"
mkdir "%STAGE%"
echo extracting %~1
tar -xzf "%~1" -C "%STAGE%"
if errorlevel 1 (
  echo error: failed to extract %~1 1>&2
  rmdir /s /q "%STAGE%"
  set "FAILED=1"
  exit /b 0
)
if exist "%STAGE%\objects" (
  for /r "%STAGE%\objects" %%F in (*) do call :publish "%%F" "%%~nxF"
)
rmdir /s /q "%STAGE%"
exit /b 0

rem Moves one staged object to objects\aa\bb\oid.
:publish
set "OID=%~2"
set "DEST=%LFS%\objects\%OID:~0,2%\%OID:~2,2%"
if not exist "%DEST%" mkdir "%DEST%"
move /y "%~1" "%DEST%\%OID%" >nul || set "FAILED=1"
exit /b 0
)";

std::string ToCrlf(std::string_view text) {
  std::string converted;
  converted.reserve(text.size() + text.size() / 16U);
  for (const char c : text) {
    if (c == '\n') {
      converted.push_back('\r');
    }
    converted.push_back(c);
  }
  return converted;
}

bool IsBranchChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
         c == '.' || c == '_' || c == '/' || c == '-';
}

} // namespace

const char* ScriptFileName(ScriptFlavor flavor) {
  switch (flavor) {
  case ScriptFlavor::kPosixShell:
    return "boot.sh";
  case ScriptFlavor::kWindowsCmd:
    return "boot.cmd";
  }
  return "boot.sh";
}

std::string_view BootScriptTemplate(ScriptFlavor flavor) {
  return flavor == ScriptFlavor::kWindowsCmd ? kWindowsTemplate : kPosixTemplate;
}

bool IsSafeBranchName(std::string_view name) {
  if (name.empty() || name.front() == '-' || name.front() == '/' || name.back() == '/') {
    return false;
  }
  if (name.find("..") != std::string_view::npos || name.find("//") != std::string_view::npos) {
    return false;
  }
  for (const char c : name) {
    if (!IsBranchChar(c)) {
      return false;
    }
  }
  return true;
}

bool RenderTemplate(std::string_view text, const std::map<std::string, std::string>& slots,
                    std::string& rendered, std::string& error) {
  rendered.clear();
  rendered.reserve(text.size());

  std::set<std::string> used;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t open = text.find(kSlotOpen, pos);
    if (open == std::string_view::npos) {
      rendered.append(text.substr(pos));
      break;
    }
    const std::size_t close = text.find(kSlotClose, open + kSlotOpen.size());
    if (close == std::string_view::npos) {
      error = "unterminated template slot at offset " + std::to_string(open);
      return false;
    }

    const std::string slot(text.substr(open + kSlotOpen.size(), close - open - kSlotOpen.size()));
    const auto it = slots.find(slot);
    if (it == slots.end()) {
      error = "template slot has no value: " + slot;
      return false;
    }
    rendered.append(text.substr(pos, open - pos));
    rendered.append(it->second);
    used.insert(slot);
    pos = close + kSlotClose.size();
  }

  for (const auto& [name, value] : slots) {
    (void)value;
    if (used.count(name) == 0U) {
      error = "template does not use slot: " + name;
      return false;
    }
  }
  return true;
}

bool RenderBootScript(ScriptFlavor flavor, const BootScriptValues& values, std::string& rendered,
                      std::string& error) {
  if (!IsSafeBranchName(values.source_branch)) {
    error = "branch name cannot be embedded in boot scripts: '" + values.source_branch + "'";
    return false;
  }

  const std::map<std::string, std::string> slots = {
      {"source_branch", values.source_branch},
      {"pack_count", std::to_string(values.pack_count)},
  };
  if (!RenderTemplate(BootScriptTemplate(flavor), slots, rendered, error)) {
    return false;
  }
  if (flavor == ScriptFlavor::kWindowsCmd) {
    rendered = ToCrlf(rendered);
  }
  return true;
}

bool WriteBootScripts(const fs::path& output_dir, const BootScriptValues& values,
                      std::vector<fs::path>& written_paths, std::string& error) {
  written_paths.clear();
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }

  for (const ScriptFlavor flavor : {ScriptFlavor::kPosixShell, ScriptFlavor::kWindowsCmd}) {
    std::string rendered;
    if (!RenderBootScript(flavor, values, rendered, error)) {
      return false;
    }
    const fs::path path = output_dir / ScriptFileName(flavor);
    if (!core::WriteTextFileAtomic(path, rendered, error)) {
      return false;
    }
    written_paths.push_back(path);
  }

  std::error_code ec;
  fs::permissions(output_dir / ScriptFileName(ScriptFlavor::kPosixShell),
                  fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                  fs::perm_options::add, ec);
  if (ec) {
    error = "failed to mark boot.sh executable: " + ec.message();
    return false;
  }
  return true;
}

} // namespace lfspack::artifacts
