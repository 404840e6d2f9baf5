#include "artifacts/boot_script_writer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <string>

using lfspack::artifacts::ScriptFlavor;

TEST_CASE("Boot scripts embed branch and pack count", "[artifacts][boot]") {
  const lfspack::artifacts::BootScriptValues values{"feature/assets-v2", 42};

  std::string sh;
  std::string error;
  REQUIRE(lfspack::artifacts::RenderBootScript(ScriptFlavor::kPosixShell, values, sh, error));
  REQUIRE(sh.rfind("#!/bin/sh\n", 0) == 0);
  REQUIRE(sh.find("branch='feature/assets-v2'") != std::string::npos);
  REQUIRE(sh.find("restored 42 objects") != std::string::npos);
  REQUIRE(sh.find("{{") == std::string::npos);
  REQUIRE(sh.find('\r') == std::string::npos);

  std::string cmd;
  REQUIRE(lfspack::artifacts::RenderBootScript(ScriptFlavor::kWindowsCmd, values, cmd, error));
  REQUIRE(cmd.find("set \"BRANCH=feature/assets-v2\"\r\n") != std::string::npos);
  REQUIRE(cmd.find("{{") == std::string::npos);
  for (std::size_t i = 0; i < cmd.size(); ++i) {
    if (cmd[i] == '\n') {
      REQUIRE(i > 0U);
      REQUIRE(cmd[i - 1] == '\r');
    }
  }
}

TEST_CASE("Boot scripts extract through a staging directory", "[artifacts][boot]") {
  const lfspack::artifacts::BootScriptValues values{"main", 3};
  std::string error;

  std::string sh;
  REQUIRE(lfspack::artifacts::RenderBootScript(ScriptFlavor::kPosixShell, values, sh, error));
  REQUIRE(sh.find("-C .git/lfs") == std::string::npos);
  REQUIRE(sh.find("tar -xzf \"$archive\" -C \"$stage\"") != std::string::npos);
  REQUIRE(sh.find("mv -f \"$stage/$object\" \"$lfs/$object\"") != std::string::npos);
  // Extraction failures stop the script before any checkout.
  REQUIRE(sh.find("exit 1\nfi\n\ngit lfs install") != std::string::npos);

  std::string cmd;
  REQUIRE(lfspack::artifacts::RenderBootScript(ScriptFlavor::kWindowsCmd, values, cmd, error));
  REQUIRE(cmd.find("tar -xzf \"%~1\" -C \"%STAGE%\"\r\n") != std::string::npos);
  REQUIRE(cmd.find("move /y \"%~1\" \"%DEST%\\%OID%\"") != std::string::npos);
  REQUIRE(cmd.find("-C .git/lfs") == std::string::npos);
}

TEST_CASE("Boot scripts refuse branch names that need quoting", "[artifacts][boot]") {
  std::string rendered;
  std::string error;
  const lfspack::artifacts::BootScriptValues values{"main'; rm -rf /", 1};
  REQUIRE_FALSE(
      lfspack::artifacts::RenderBootScript(ScriptFlavor::kPosixShell, values, rendered, error));
  REQUIRE(error.find("branch name") != std::string::npos);
}

TEST_CASE("IsSafeBranchName accepts ordinary branch names", "[artifacts][boot]") {
  REQUIRE(lfspack::artifacts::IsSafeBranchName("main"));
  REQUIRE(lfspack::artifacts::IsSafeBranchName("release/1.2.3"));
  REQUIRE(lfspack::artifacts::IsSafeBranchName("lfs-packed"));
  REQUIRE(lfspack::artifacts::IsSafeBranchName("user_x/topic"));

  REQUIRE_FALSE(lfspack::artifacts::IsSafeBranchName(""));
  REQUIRE_FALSE(lfspack::artifacts::IsSafeBranchName("-rf"));
  REQUIRE_FALSE(lfspack::artifacts::IsSafeBranchName("a..b"));
  REQUIRE_FALSE(lfspack::artifacts::IsSafeBranchName("a//b"));
  REQUIRE_FALSE(lfspack::artifacts::IsSafeBranchName("trailing/"));
  REQUIRE_FALSE(lfspack::artifacts::IsSafeBranchName("has space"));
  REQUIRE_FALSE(lfspack::artifacts::IsSafeBranchName("%PATH%"));
  REQUIRE_FALSE(lfspack::artifacts::IsSafeBranchName("$(id)"));
}

TEST_CASE("RenderTemplate requires every slot to be bound and used", "[artifacts][template]") {
  std::string rendered;
  std::string error;

  REQUIRE(lfspack::artifacts::RenderTemplate("a={{a}} b={{b}} a={{a}}", {{"a", "1"}, {"b", "2"}},
                                             rendered, error));
  REQUIRE(rendered == "a=1 b=2 a=1");

  REQUIRE_FALSE(lfspack::artifacts::RenderTemplate("{{missing}}", {}, rendered, error));
  REQUIRE(error == "template slot has no value: missing");

  REQUIRE_FALSE(lfspack::artifacts::RenderTemplate("plain", {{"extra", "x"}}, rendered, error));
  REQUIRE(error == "template does not use slot: extra");

  REQUIRE_FALSE(lfspack::artifacts::RenderTemplate("{{open", {}, rendered, error));
  REQUIRE(error.find("unterminated") != std::string::npos);
}
