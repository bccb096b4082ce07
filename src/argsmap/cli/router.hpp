#pragma once

#include "argsapt/args_resource_mapper.hpp"
#include "core/logging/logger.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace argsmap::cli {

// Options shared by `argsmap map` and in-process callers (build steps linking
// argsmap_core directly), so both paths run the same pipeline.
struct MapOptions {
  std::filesystem::path plan_path;
  // Replaces the plan's classdirs when non-empty.
  std::vector<std::filesystem::path> classdirs;
  // Forces include_all on; the plan value is used otherwise.
  bool include_all = false;
  // Restricts the run to these unit ids; every unit in the plan otherwise.
  std::vector<std::string> targets;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Loads the plan, runs the mapper and returns a process exit code.
// `report` is filled when non-null, including on failure.
int ExecuteMap(const MapOptions& options, argsapt::MapperReport* report);

// Routes `argsmap` subcommands and returns process exit codes:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => build plan invalid
//   20 => archive could not be updated
//   30 => malformed args record
int Dispatch(int argc, char** argv);

} // namespace argsmap::cli
