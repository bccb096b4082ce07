#include "argsapt/args_resource_mapper.hpp"

#include "argsapt/classname_collector.hpp"
#include "argsapt/record_filter.hpp"
#include "argsapt/resource_merger.hpp"
#include "argsapt/resource_scanner.hpp"
#include "argsapt/args_resource.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace argsmap::argsapt {

namespace {

// Restores the logger's target context when a binary finishes, whichever way
// it finishes.
class ScopedLogTarget {
public:
  ScopedLogTarget(core::logging::Logger& logger, const std::string& target) : logger_(logger) {
    logger_.SetTarget(target);
  }

  ~ScopedLogTarget() {
    logger_.ClearTarget();
  }

  ScopedLogTarget(const ScopedLogTarget&) = delete;
  ScopedLogTarget& operator=(const ScopedLogTarget&) = delete;

private:
  core::logging::Logger& logger_;
};

} // namespace

std::size_t MapperReport::ArchivesUpdated() const {
  return static_cast<std::size_t>(
      std::count_if(archives.begin(), archives.end(),
                    [](const ArchiveOutcome& outcome) { return outcome.updated; }));
}

ArgsResourceMapper::ArgsResourceMapper(MapperOptions options, const build::JarProducts& jars,
                                       core::logging::Logger& logger)
    : options_(std::move(options)), jars_(jars), logger_(logger) {}

bool ArgsResourceMapper::Execute(const std::vector<const build::IBuildUnit*>& targets,
                                 MapperReport& report, std::string& error) {
  report = MapperReport{};

  if (options_.classdirs.empty()) {
    logger_.Debug("no classdirs configured, skipping args resource mapping");
    return true;
  }

  logger_.Info("args resource mapping started",
               {{"targets", std::to_string(targets.size())},
                {"classdirs", std::to_string(options_.classdirs.size())},
                {"include_all", options_.include_all ? "true" : "false"}});

  // Each target is processed once, however often it is listed.
  std::unordered_set<const build::IBuildUnit*> seen;
  for (const build::IBuildUnit* target : targets) {
    if (target == nullptr || !seen.insert(target).second) {
      continue;
    }
    if (!target->IsBinary()) {
      logger_.Debug("target is not a binary, skipping", {{"unit", target->Id()}});
      continue;
    }

    const build::JarMapping* mapping = jars_.Get(target->Id());
    if (mapping == nullptr) {
      logger_.Debug("binary has no jar products, skipping", {{"unit", target->Id()}});
      continue;
    }

    ScopedLogTarget log_target(logger_, target->Id());
    if (!MapBinary(*target, *mapping, report, error)) {
      logger_.Error("args resource mapping failed", {{"error", error}});
      return false;
    }
    ++report.binaries_processed;
  }

  logger_.Info("args resource mapping finished",
               {{"binaries", std::to_string(report.binaries_processed)},
                {"archives_updated", std::to_string(report.ArchivesUpdated())}});
  return true;
}

bool ArgsResourceMapper::ComputeRecords(const build::IBuildUnit& binary,
                                        std::vector<std::string>& records,
                                        MapperFailure& failure, std::string& error) const {
  records.clear();
  failure = MapperFailure::kNone;

  ScanResult scan;
  if (!ScanArgsRecords(options_.classdirs, scan, error)) {
    failure = MapperFailure::kScan;
    return false;
  }
  logger_.Debug("args records scanned",
                {{"files", std::to_string(scan.files.size())},
                 {"records", std::to_string(scan.records.size())}});
  if (scan.records.empty()) {
    return true;
  }

  ClassNameSet class_names;
  if (!options_.include_all) {
    class_names = CollectClassNames(binary);
    logger_.Debug("reachable classes collected", {{"classes", std::to_string(class_names.size())}});
  }

  if (!FilterArgsRecords(scan.records, class_names, options_.include_all, records, error)) {
    failure = MapperFailure::kRecordMalformed;
    return false;
  }
  return true;
}

bool ArgsResourceMapper::MapBinary(const build::IBuildUnit& binary,
                                   const build::JarMapping& mapping, MapperReport& report,
                                   std::string& error) {
  std::vector<std::string> records;
  MapperFailure failure = MapperFailure::kNone;
  if (!ComputeRecords(binary, records, failure, error)) {
    report.failure = failure;
    return false;
  }

  for (const auto& [base_dir, jar_names] : mapping.by_base_dir) {
    for (const std::string& jar_name : jar_names) {
      ArchiveOutcome outcome;
      outcome.unit_id = binary.Id();
      outcome.archive_path = base_dir / jar_name;

      if (records.empty()) {
        logger_.Info("no args records to merge, archive left untouched",
                     {{"archive", outcome.archive_path.string()}});
        report.archives.push_back(std::move(outcome));
        continue;
      }

      MergeResult merge;
      if (!MergeArgsResource(outcome.archive_path, records, merge, error)) {
        report.failure = MapperFailure::kArchive;
        report.archives.push_back(std::move(outcome));
        return false;
      }

      if (merge.had_existing_entry) {
        logger_.Warn("archive already contained an args resource, appended another entry",
                     {{"archive", outcome.archive_path.string()},
                      {"entry", kArgsResourceEntryPath}});
      }
      outcome.updated = true;
      outcome.record_count = merge.record_count;
      outcome.had_existing_entry = merge.had_existing_entry;
      logger_.Info("args resource written",
                   {{"archive", outcome.archive_path.string()},
                    {"records", std::to_string(outcome.record_count)}});
      report.archives.push_back(std::move(outcome));
    }
  }
  return true;
}

} // namespace argsmap::argsapt
