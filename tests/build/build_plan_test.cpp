#include "build/build_plan.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using argsmap::build::BuildPlan;
using argsmap::build::Language;
using argsmap::build::ParseBuildPlanText;
using argsmap::build::UnitType;

namespace {

constexpr const char* kFullPlan = R"([args-apt]
classdirs = out/classes /abs/extra
include_all = no

[unit src/java/com/foo:main]
type = jvm_binary
sources = com/foo/Main.java
dependencies = src/java/com/foo:lib
    3rdparty:guava

[unit src/java/com/foo:lib]
type = java_library
sources = com/foo/Util.java com/foo/Flags.java

[unit 3rdparty:guava]
type = jar_library

[unit src/scala/com/foo:tool]
type = scala_library
language = scala
internal = false

[jars src/java/com/foo:main]
dist = main.jar
dist/extra = main-extra.jar other.jar
)";

} // namespace

TEST_CASE("A complete plan builds graph, jars and options", "[build][plan]") {
  BuildPlan plan;
  std::string error;
  REQUIRE(ParseBuildPlanText(kFullPlan, fs::path("/work"), plan, error));

  REQUIRE(plan.classdirs ==
          std::vector<fs::path>{fs::path("/work/out/classes"), fs::path("/abs/extra")});
  REQUIRE_FALSE(plan.include_all);

  REQUIRE(plan.graph.Size() == 4U);
  const auto* main = plan.graph.Find("src/java/com/foo:main");
  REQUIRE(main != nullptr);
  REQUIRE(main->IsBinary());
  REQUIRE(main->Type() == UnitType::kJvmBinary);
  REQUIRE(main->Dependencies().size() == 2U);
  REQUIRE(main->Dependencies()[0]->Id() == "src/java/com/foo:lib");
  REQUIRE(main->Dependencies()[1]->Id() == "3rdparty:guava");

  REQUIRE_FALSE(plan.graph.Find("3rdparty:guava")->IsInternal());
  REQUIRE(plan.graph.Find("src/java/com/foo:lib")->IsInternal());
  const auto* tool = plan.graph.Find("src/scala/com/foo:tool");
  REQUIRE_FALSE(tool->IsInternal());
  REQUIRE(tool->IsSourceLanguage(Language::kScala));
  REQUIRE_FALSE(tool->IsSourceLanguage(Language::kJava));

  const auto* mapping = plan.jars.Get("src/java/com/foo:main");
  REQUIRE(mapping != nullptr);
  REQUIRE(mapping->by_base_dir.size() == 2U);
  REQUIRE(mapping->by_base_dir[0].first == fs::path("/work/dist"));
  REQUIRE(mapping->by_base_dir[0].second == std::vector<std::string>{"main.jar"});
  REQUIRE(mapping->by_base_dir[1].first == fs::path("/work/dist/extra"));
  REQUIRE(mapping->by_base_dir[1].second ==
          std::vector<std::string>{"main-extra.jar", "other.jar"});
  REQUIRE(plan.jars.Get("src/java/com/foo:lib") == nullptr);
}

TEST_CASE("Jar sections may precede their unit", "[build][plan]") {
  BuildPlan plan;
  std::string error;
  REQUIRE(ParseBuildPlanText("[jars app:bin]\nout = app.jar\n[unit app:bin]\ntype = jvm_binary\n",
                             fs::path(), plan, error));
  REQUIRE(plan.jars.UnitIds() == std::vector<std::string>{"app:bin"});
  REQUIRE(plan.jars.Get("app:bin")->by_base_dir[0].first == fs::path("out"));
}

TEST_CASE("Plan errors name the offending line", "[build][plan]") {
  BuildPlan plan;
  std::string error;

  REQUIRE_FALSE(ParseBuildPlanText("[args-apt]\nclassdir = out\n", fs::path(), plan, error));
  REQUIRE(error == "line 2: unknown key 'classdir' in [args-apt]");

  REQUIRE_FALSE(ParseBuildPlanText("[target a]\n", fs::path(), plan, error));
  REQUIRE(error == "line 1: unknown section [target]");

  REQUIRE_FALSE(ParseBuildPlanText("[unit a]\nsources = A.java\n", fs::path(), plan, error));
  REQUIRE(error == "line 1: unit a is missing required key 'type'");

  REQUIRE_FALSE(ParseBuildPlanText("[unit a]\n\ntype = python_library\n", fs::path(), plan,
                                   error));
  REQUIRE(error.rfind("line 3: unknown unit type 'python_library'", 0) == 0);

  REQUIRE_FALSE(ParseBuildPlanText("[args-apt]\ninclude_all = maybe\n", fs::path(), plan, error));
  REQUIRE(error.rfind("line 2: invalid boolean for 'include_all'", 0) == 0);

  REQUIRE_FALSE(ParseBuildPlanText("[args-apt]\n[args-apt]\n", fs::path(), plan, error));
  REQUIRE(error == "line 2: duplicate [args-apt] section");

  REQUIRE_FALSE(ParseBuildPlanText("[unit a]\ntype = jvm_binary\n[unit a]\ntype = jvm_binary\n",
                                   fs::path(), plan, error));
  REQUIRE(error == "line 3: duplicate unit id: a");
}

TEST_CASE("Plans with unresolved references are rejected", "[build][plan]") {
  BuildPlan plan;
  std::string error;

  REQUIRE_FALSE(ParseBuildPlanText("[unit a]\ntype = jvm_binary\ndependencies = b\n", fs::path(),
                                   plan, error));
  REQUIRE(error == "unit a depends on undefined unit: b");

  REQUIRE_FALSE(ParseBuildPlanText("[unit a]\ntype = jvm_binary\n\n[jars b]\nout = b.jar\n",
                                   fs::path(), plan, error));
  REQUIRE(error == "line 4: jars declared for undefined unit: b");

  REQUIRE_FALSE(ParseBuildPlanText("[unit a]\ntype = jvm_binary\n[jars a]\nout =\n", fs::path(),
                                   plan, error));
  REQUIRE(error == "line 4: no jars listed for base directory 'out'");
}
