#include "argsmap/cli/router.hpp"

#include "argsapt/args_resource.hpp"
#include "argsapt/resource_merger.hpp"
#include "build/build_plan.hpp"
#include "core/errors/exit_codes.hpp"

#include <iostream>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace argsmap::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitArchiveFailed = core::errors::ToInt(core::errors::ExitCode::kArchiveFailed);
constexpr int kExitRecordMalformed =
    core::errors::ToInt(core::errors::ExitCode::kRecordMalformed);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  argsmap map <plan.ini> [--classdir <dir>]... [--include-all] [--target <id>]... "
         "[--log-level <debug|info|warn|error>]\n"
      << "  argsmap render <plan.ini> --target <id> [--classdir <dir>]... [--include-all] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  argsmap version\n"
      << "  argsmap help\n";
}

int ExitCodeForFailure(argsapt::MapperFailure failure) {
  switch (failure) {
  case argsapt::MapperFailure::kNone:
  case argsapt::MapperFailure::kScan:
    return kExitFailure;
  case argsapt::MapperFailure::kRecordMalformed:
    return kExitRecordMalformed;
  case argsapt::MapperFailure::kArchive:
    return kExitArchiveFailed;
  }
  return kExitFailure;
}

// Parse `map`/`render` args with an explicit contract:
// - exactly one plan path
// - repeatable `--classdir <dir>` and `--target <id>`
// - optional `--include-all` and `--log-level <level>`
// Unknown flags, missing flag values and extra positionals are usage errors.
bool ParseMapOptions(const std::vector<std::string_view>& args, MapOptions& options,
                     std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];

    if (token == "--include-all") {
      options.include_all = true;
      continue;
    }

    if (token == "--classdir" || token == "--target" || token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      const std::string_view value = args[++i];
      if (token == "--classdir") {
        if (value.empty()) {
          error = "--classdir cannot be empty";
          return false;
        }
        options.classdirs.emplace_back(value);
      } else if (token == "--target") {
        options.targets.emplace_back(value);
      } else if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (token.starts_with("--")) {
      error = "unknown option: " + std::string(token);
      return false;
    }

    if (!options.plan_path.empty()) {
      error = "unexpected extra argument: " + std::string(token);
      return false;
    }
    options.plan_path = fs::path(token);
  }

  if (options.plan_path.empty()) {
    error = "missing required argument: <plan.ini>";
    return false;
  }
  return true;
}

// Applies CLI overrides on top of the plan's task section.
argsapt::MapperOptions BuildMapperOptions(const MapOptions& options,
                                          const build::BuildPlan& plan) {
  argsapt::MapperOptions mapper_options;
  mapper_options.classdirs = options.classdirs.empty() ? plan.classdirs : options.classdirs;
  mapper_options.include_all = options.include_all || plan.include_all;
  return mapper_options;
}

bool ResolveTargets(const MapOptions& options, const build::BuildPlan& plan,
                    std::vector<const build::IBuildUnit*>& targets, std::string& error) {
  targets.clear();
  if (options.targets.empty()) {
    for (const build::BuildUnit* unit : plan.graph.Units()) {
      targets.push_back(unit);
    }
    return true;
  }

  for (const std::string& id : options.targets) {
    const build::BuildUnit* unit = plan.graph.Find(id);
    if (unit == nullptr) {
      error = "target not defined in build plan: " + id;
      return false;
    }
    targets.push_back(unit);
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "argsmap 0.1.0\n";
  return kExitSuccess;
}

int CommandMap(const std::vector<std::string_view>& args) {
  MapOptions options;
  std::string error;
  if (!ParseMapOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  argsapt::MapperReport report;
  const int exit_code = ExecuteMap(options, &report);
  if (exit_code != kExitSuccess) {
    return exit_code;
  }

  std::cout << "mapped: binaries=" << report.binaries_processed
            << " archives_updated=" << report.ArchivesUpdated()
            << " archives_untouched=" << (report.archives.size() - report.ArchivesUpdated())
            << '\n';
  return kExitSuccess;
}

int CommandRender(const std::vector<std::string_view>& args) {
  MapOptions options;
  std::string error;
  if (!ParseMapOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  if (options.targets.size() != 1U) {
    std::cerr << "error: render requires exactly one --target <id>\n";
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  build::BuildPlan plan;
  if (!build::LoadBuildPlanFile(options.plan_path, plan, error)) {
    logger.Error("failed to load build plan", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  const build::BuildUnit* unit = plan.graph.Find(options.targets.front());
  if (unit == nullptr) {
    std::cerr << "error: target not defined in build plan: " << options.targets.front() << '\n';
    return kExitConfigInvalid;
  }
  if (!unit->IsBinary()) {
    std::cerr << "error: target is not a binary: " << unit->Id() << '\n';
    return kExitUsage;
  }

  const argsapt::ArgsResourceMapper mapper(BuildMapperOptions(options, plan), plan.jars, logger);
  std::vector<std::string> records;
  argsapt::MapperFailure failure = argsapt::MapperFailure::kNone;
  if (!mapper.ComputeRecords(*unit, records, failure, error)) {
    logger.Error("failed to compute args records", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return ExitCodeForFailure(failure);
  }

  if (!records.empty()) {
    std::cout << argsapt::RenderArgsResource(std::move(records), argsapt::kArgsResourceHeader);
  }
  return kExitSuccess;
}

} // namespace

int ExecuteMap(const MapOptions& options, argsapt::MapperReport* report) {
  core::logging::Logger logger(options.log_level);

  if (report != nullptr) {
    *report = argsapt::MapperReport{};
  }

  logger.Info("map requested",
              {{"plan", options.plan_path.string()},
               {"classdir_overrides", std::to_string(options.classdirs.size())},
               {"include_all", options.include_all ? "true" : "false"}});

  std::string error;
  build::BuildPlan plan;
  if (!build::LoadBuildPlanFile(options.plan_path, plan, error)) {
    logger.Error("failed to load build plan", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  std::vector<const build::IBuildUnit*> targets;
  if (!ResolveTargets(options, plan, targets, error)) {
    logger.Error("failed to resolve targets", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  argsapt::ArgsResourceMapper mapper(BuildMapperOptions(options, plan), plan.jars, logger);
  argsapt::MapperReport local_report;
  argsapt::MapperReport& mapper_report = report != nullptr ? *report : local_report;
  if (!mapper.Execute(targets, mapper_report, error)) {
    std::cerr << "error: " << error << '\n';
    return ExitCodeForFailure(mapper_report.failure);
  }

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

  if (command == "map") {
    return CommandMap(args);
  }

  if (command == "render") {
    return CommandRender(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace argsmap::cli
