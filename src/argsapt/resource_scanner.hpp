#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace argsmap::argsapt {

using RecordSet = std::set<std::string>;

struct ScanResult {
  // Unique record lines without their terminators.
  RecordSet records;
  // Files that contributed, in the order they were read.
  std::vector<std::filesystem::path> files;
};

// Reads args-apt records from `<base_dir>/<relative_dir>/<basename_prefix>*`
// for every base directory.
//
// Contract:
// - A missing `<base_dir>/<relative_dir>` is skipped; it means the processor
//   produced nothing for that root.
// - Only regular files directly inside the directory are considered.
// - Blank and whitespace-only lines are not records.
// - Duplicate lines across files and directories collapse.
// - Returns false with `error` populated if a directory cannot be listed or a
//   matching file cannot be read.
bool ScanArgsRecords(const std::vector<std::filesystem::path>& base_dirs,
                     std::string_view relative_dir, std::string_view basename_prefix,
                     ScanResult& result, std::string& error);

// Same as above with the processor's fixed directory and basename.
bool ScanArgsRecords(const std::vector<std::filesystem::path>& base_dirs, ScanResult& result,
                     std::string& error);

} // namespace argsmap::argsapt
