#pragma once

#include "build/build_graph.hpp"
#include "build/jar_products.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace argsmap::build {

// Everything one mapper invocation needs: the graph of units, the jars the
// packaging step produced for them, and the args-apt task options.
struct BuildPlan {
  BuildGraph graph;
  JarProducts jars;
  std::vector<std::filesystem::path> classdirs;
  bool include_all = false;
};

// Parses plan text. Relative classdirs and jar base directories resolve
// against `base_dir`.
//
// Sections:
//   [args-apt]       classdirs, include_all
//   [unit <id>]      type, language, sources, dependencies, internal
//   [jars <id>]      <base_dir> = <jar> [<jar> ...]
// Returns false on syntax errors, unknown sections/keys, bad values, dangling
// dependency ids and jars declared for undefined units.
bool ParseBuildPlanText(std::string_view text, const std::filesystem::path& base_dir,
                        BuildPlan& plan, std::string& error);

bool LoadBuildPlanFile(const std::filesystem::path& plan_path, BuildPlan& plan,
                       std::string& error);

} // namespace argsmap::build
