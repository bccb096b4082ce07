#pragma once

#include "build/build_unit.hpp"
#include "build/jar_products.hpp"
#include "core/logging/logger.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace argsmap::argsapt {

struct MapperOptions {
  // Class output roots the args processor wrote into.
  std::vector<std::filesystem::path> classdirs;
  // Skip class filtering and merge every record.
  bool include_all = false;
};

enum class MapperFailure {
  kNone,
  kScan,
  kRecordMalformed,
  kArchive,
};

struct ArchiveOutcome {
  std::string unit_id;
  std::filesystem::path archive_path;
  std::size_t record_count = 0;
  bool updated = false;
  bool had_existing_entry = false;
};

struct MapperReport {
  std::size_t binaries_processed = 0;
  std::vector<ArchiveOutcome> archives;
  MapperFailure failure = MapperFailure::kNone;

  std::size_t ArchivesUpdated() const;
};

// Injects the merged args-apt resource into every jar produced for the binary
// targets it is given.
//
// Per binary: collect reachable class names, scan the classdirs, filter the
// records once, then append the resource to each of the binary's jars.
// Non-binary targets and binaries without jars are skipped. Processing stops
// at the first failure; archives finished before it keep their new entry.
class ArgsResourceMapper {
public:
  ArgsResourceMapper(MapperOptions options, const build::JarProducts& jars,
                     core::logging::Logger& logger);

  bool Execute(const std::vector<const build::IBuildUnit*>& targets, MapperReport& report,
               std::string& error);

  // Records that Execute() would write for `binary`, unsorted. Empty when
  // nothing survives or nothing was scanned.
  bool ComputeRecords(const build::IBuildUnit& binary, std::vector<std::string>& records,
                      MapperFailure& failure, std::string& error) const;

  const MapperOptions& Options() const {
    return options_;
  }

private:
  bool MapBinary(const build::IBuildUnit& binary, const build::JarMapping& mapping,
                 MapperReport& report, std::string& error);

  MapperOptions options_;
  const build::JarProducts& jars_;
  core::logging::Logger& logger_;
};

} // namespace argsmap::argsapt
