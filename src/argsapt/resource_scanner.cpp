#include "argsapt/resource_scanner.hpp"

#include "argsapt/args_resource.hpp"
#include "core/fs_utils.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace argsmap::argsapt {

namespace {

bool ListMatchingFiles(const fs::path& resource_dir, std::string_view basename_prefix,
                       std::vector<fs::path>& matches, std::string& error) {
  matches.clear();

  std::error_code ec;
  fs::directory_iterator it(resource_dir, ec);
  if (ec) {
    error = "failed to list args resource directory '" + resource_dir.string() +
            "': " + ec.message();
    return false;
  }

  while (it != fs::directory_iterator()) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && !type_ec &&
        it->path().filename().string().starts_with(basename_prefix)) {
      matches.push_back(it->path());
    }
    it.increment(ec);
    if (ec) {
      break;
    }
  }
  if (ec) {
    error = "failed while listing args resource directory '" + resource_dir.string() +
            "': " + ec.message();
    return false;
  }

  // Listing order is filesystem dependent; read in a stable order so logs and
  // ScanResult::files are reproducible.
  std::sort(matches.begin(), matches.end());
  return true;
}

} // namespace

bool ScanArgsRecords(const std::vector<fs::path>& base_dirs, std::string_view relative_dir,
                     std::string_view basename_prefix, ScanResult& result, std::string& error) {
  result = ScanResult{};

  for (const fs::path& base_dir : base_dirs) {
    const fs::path resource_dir = base_dir / fs::path(relative_dir);

    std::error_code ec;
    if (!fs::is_directory(resource_dir, ec) || ec) {
      continue;
    }

    std::vector<fs::path> matches;
    if (!ListMatchingFiles(resource_dir, basename_prefix, matches, error)) {
      return false;
    }

    for (const fs::path& match : matches) {
      std::string contents;
      if (!core::ReadTextFile(match, contents, error)) {
        return false;
      }
      for (std::string& line : core::SplitLines(contents)) {
        if (core::TrimWhitespace(line).empty()) {
          continue;
        }
        result.records.insert(std::move(line));
      }
      result.files.push_back(match);
    }
  }

  return true;
}

bool ScanArgsRecords(const std::vector<fs::path>& base_dirs, ScanResult& result,
                     std::string& error) {
  return ScanArgsRecords(base_dirs, kArgsResourceDir, kArgsResourceBasename, result, error);
}

} // namespace argsmap::argsapt
