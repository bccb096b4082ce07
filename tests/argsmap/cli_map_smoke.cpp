#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"
#include "../common/zip_fixtures.hpp"
#include "core/errors/exit_codes.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

using argsmap::core::errors::ExitCode;
using argsmap::core::errors::ToInt;
using argsmap::tests::common::AssertContains;
using argsmap::tests::common::AssertEquals;
using argsmap::tests::common::DispatchCaptured;
using argsmap::tests::common::DispatchOutput;
using argsmap::tests::common::Fail;
using argsmap::tests::common::ReadFileToString;
using argsmap::tests::common::ReadFixtureZip;
using argsmap::tests::common::ScopedTempDir;
using argsmap::tests::common::WriteFileOrFail;
using argsmap::tests::common::WriteFixtureZip;

namespace {

constexpr const char* kEntryPath = "com/twitter/common/args/apt/cmdline.arg.info.txt.0";

void ExpectExit(const DispatchOutput& output, ExitCode expected, std::string_view label) {
  if (output.exit_code != ToInt(expected)) {
    Fail(std::string(label) + ": expected exit " + std::to_string(ToInt(expected)) + " got " +
         std::to_string(output.exit_code) + "\nstdout: " + output.stdout_text +
         "\nstderr: " + output.stderr_text);
  }
}

// Writes a plan, class output and a jar under `root`; returns the plan path.
fs::path WriteWorkspace(const fs::path& root, std::string_view records) {
  WriteFileOrFail(root / "out" / "classes" / "com/twitter/common/args/apt" /
                      "cmdline.arg.info.txt.0",
                  records);
  WriteFixtureZip(root / "dist" / "main.jar", {{"META-INF/MANIFEST.MF", "Manifest-Version: 1.0\n"}});

  const fs::path plan = root / "plan.ini";
  WriteFileOrFail(plan, "[args-apt]\n"
                        "classdirs = out/classes\n"
                        "\n"
                        "[unit app:main]\n"
                        "type = jvm_binary\n"
                        "sources = com/foo/Main.java\n"
                        "dependencies = app:lib\n"
                        "\n"
                        "[unit app:lib]\n"
                        "type = java_library\n"
                        "sources = com/foo/Util.java\n"
                        "\n"
                        "[jars app:main]\n"
                        "dist = main.jar\n");
  return plan;
}

void MapWritesResource(const fs::path& root) {
  const fs::path plan = WriteWorkspace(root, "field com.foo.Main x\nfield com.bar.Other y\n"
                                             "cmdline something\n");

  const DispatchOutput output = DispatchCaptured({"argsmap", "map", plan.string()});
  ExpectExit(output, ExitCode::kSuccess, "map");
  AssertEquals(output.stdout_text, "mapped: binaries=1 archives_updated=1 archives_untouched=0\n",
               "map summary");
  AssertContains(output.stderr_text, "msg=\"args resource written\"");

  bool found = false;
  for (const auto& entry : ReadFixtureZip(root / "dist" / "main.jar").entries) {
    if (entry.path == kEntryPath) {
      found = true;
      AssertEquals(entry.data,
                   "# Created by pants goal binary:args-apt\ncmdline something\n"
                   "field com.foo.Main x\n",
                   "args resource content");
    }
  }
  if (!found) {
    Fail("map did not add the args resource");
  }
}

void RepeatedTargetFlagWritesOnce(const fs::path& root) {
  const fs::path plan = WriteWorkspace(root, "field com.foo.Main x\n");

  const DispatchOutput output = DispatchCaptured(
      {"argsmap", "map", plan.string(), "--target", "app:main", "--target", "app:main"});
  ExpectExit(output, ExitCode::kSuccess, "map with repeated target");
  AssertEquals(output.stdout_text, "mapped: binaries=1 archives_updated=1 archives_untouched=0\n",
               "repeated target summary");

  std::size_t matches = 0;
  for (const auto& entry : ReadFixtureZip(root / "dist" / "main.jar").entries) {
    if (entry.path == kEntryPath) {
      ++matches;
    }
  }
  if (matches != 1U) {
    Fail("repeated --target should append the args resource once");
  }
}

void RenderPrintsWithoutWriting(const fs::path& root) {
  const fs::path plan = WriteWorkspace(root, "field com.bar.Other y\ncmdline something\n");
  const std::string before = ReadFileToString(root / "dist" / "main.jar");

  const DispatchOutput filtered =
      DispatchCaptured({"argsmap", "render", plan.string(), "--target", "app:main"});
  ExpectExit(filtered, ExitCode::kSuccess, "render");
  AssertEquals(filtered.stdout_text,
               "# Created by pants goal binary:args-apt\ncmdline something\n", "render output");

  const DispatchOutput all = DispatchCaptured(
      {"argsmap", "render", plan.string(), "--target", "app:main", "--include-all"});
  ExpectExit(all, ExitCode::kSuccess, "render --include-all");
  AssertContains(all.stdout_text, "field com.bar.Other y\n");

  const DispatchOutput library =
      DispatchCaptured({"argsmap", "render", plan.string(), "--target", "app:lib"});
  ExpectExit(library, ExitCode::kUsage, "render library");
  AssertContains(library.stderr_text, "target is not a binary: app:lib");

  const DispatchOutput no_target = DispatchCaptured({"argsmap", "render", plan.string()});
  ExpectExit(no_target, ExitCode::kUsage, "render without target");

  AssertEquals(ReadFileToString(root / "dist" / "main.jar"), before, "archive after render");
}

void ClassdirOverrideReplacesPlanClassdirs(const fs::path& root) {
  const fs::path plan = WriteWorkspace(root, "field com.foo.Main x\n");
  const fs::path empty_classdir = root / "empty-classes";
  fs::create_directories(empty_classdir);
  const std::string before = ReadFileToString(root / "dist" / "main.jar");

  const DispatchOutput output = DispatchCaptured(
      {"argsmap", "map", plan.string(), "--classdir", empty_classdir.string()});
  ExpectExit(output, ExitCode::kSuccess, "map with classdir override");
  AssertEquals(output.stdout_text, "mapped: binaries=1 archives_updated=0 archives_untouched=1\n",
               "override summary");
  AssertEquals(ReadFileToString(root / "dist" / "main.jar"), before, "archive after override");
}

void FailuresMapToExitCodes(const fs::path& root) {
  const DispatchOutput missing_plan =
      DispatchCaptured({"argsmap", "map", (root / "nope.ini").string()});
  ExpectExit(missing_plan, ExitCode::kConfigInvalid, "missing plan");
  AssertContains(missing_plan.stderr_text, "build plan not found: ");

  const fs::path bad_plan = root / "bad.ini";
  WriteFileOrFail(bad_plan, "[unit a]\ntype = cobol_library\n");
  const DispatchOutput invalid = DispatchCaptured({"argsmap", "map", bad_plan.string()});
  ExpectExit(invalid, ExitCode::kConfigInvalid, "invalid plan");
  AssertContains(invalid.stderr_text, "line 2: unknown unit type 'cobol_library'");

  const fs::path plan = WriteWorkspace(root / "ws", "field com.foo.Main x\n");
  const DispatchOutput unknown_target =
      DispatchCaptured({"argsmap", "map", plan.string(), "--target", "app:missing"});
  ExpectExit(unknown_target, ExitCode::kConfigInvalid, "unknown target");
  AssertContains(unknown_target.stderr_text, "target not defined in build plan: app:missing");

  fs::remove(root / "ws" / "dist" / "main.jar");
  const DispatchOutput missing_jar = DispatchCaptured({"argsmap", "map", plan.string()});
  ExpectExit(missing_jar, ExitCode::kArchiveFailed, "missing jar");
  AssertContains(missing_jar.stderr_text, "archive not found: ");

  const fs::path malformed = WriteWorkspace(root / "ws-malformed", "positional\n");
  const DispatchOutput bad_record = DispatchCaptured({"argsmap", "map", malformed.string()});
  ExpectExit(bad_record, ExitCode::kRecordMalformed, "malformed record");
}

void UsageErrors() {
  ExpectExit(DispatchCaptured({"argsmap"}), ExitCode::kUsage, "no command");
  ExpectExit(DispatchCaptured({"argsmap", "frobnicate"}), ExitCode::kUsage, "unknown command");
  ExpectExit(DispatchCaptured({"argsmap", "map"}), ExitCode::kUsage, "map without plan");
  ExpectExit(DispatchCaptured({"argsmap", "map", "a.ini", "b.ini"}), ExitCode::kUsage,
             "extra positional");
  ExpectExit(DispatchCaptured({"argsmap", "map", "a.ini", "--bogus"}), ExitCode::kUsage,
             "unknown option");
  ExpectExit(DispatchCaptured({"argsmap", "map", "a.ini", "--classdir"}), ExitCode::kUsage,
             "missing option value");

  const DispatchOutput bad_level =
      DispatchCaptured({"argsmap", "map", "a.ini", "--log-level", "loud"});
  ExpectExit(bad_level, ExitCode::kUsage, "bad log level");
  AssertContains(bad_level.stderr_text, "invalid --log-level 'loud'");

  const DispatchOutput help = DispatchCaptured({"argsmap", "help"});
  ExpectExit(help, ExitCode::kSuccess, "help");
  AssertContains(help.stdout_text, "argsmap map <plan.ini>");
  AssertContains(help.stdout_text, "argsmap help\n");

  const DispatchOutput version = DispatchCaptured({"argsmap", "version"});
  ExpectExit(version, ExitCode::kSuccess, "version");
  AssertEquals(version.stdout_text, "argsmap 0.1.0\n", "version output");
  ExpectExit(DispatchCaptured({"argsmap", "version", "extra"}), ExitCode::kUsage,
             "version with args");
}

} // namespace

int main() {
  const ScopedTempDir temp("argsmap-cli-map-smoke");

  MapWritesResource(temp.path() / "map");
  RepeatedTargetFlagWritesOnce(temp.path() / "repeated");
  RenderPrintsWithoutWriting(temp.path() / "render");
  ClassdirOverrideReplacesPlanClassdirs(temp.path() / "override");
  FailuresMapToExitCodes(temp.path() / "failures");
  UsageErrors();

  return 0;
}
