#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace argsmap::argsapt {

// `header` then every record in ascending byte order, each line ending in
// '\n'. Any permutation of the same records renders identically.
std::string RenderArgsResource(std::vector<std::string> records, std::string_view header);

struct MergeResult {
  std::size_t record_count = 0;
  // The archive already held an entry at the target path before this merge.
  bool had_existing_entry = false;
};

// Appends the rendered resource to `archive_path` as `entry_path`.
//
// Contract:
// - `records` must be non-empty; callers skip the merge when there is nothing
//   to write so the archive stays untouched.
// - The archive must already exist and is never recreated.
// - The archive handle is released on every return path; on failure the
//   archive is left as it was.
// - An existing entry at `entry_path` is kept; the new one is appended after
//   it and `had_existing_entry` is set.
bool MergeArgsResource(const std::filesystem::path& archive_path,
                       const std::vector<std::string>& records, std::string_view entry_path,
                       std::string_view header, MergeResult& result, std::string& error);

// MergeArgsResource() with the args-apt entry path and header.
bool MergeArgsResource(const std::filesystem::path& archive_path,
                       const std::vector<std::string>& records, MergeResult& result,
                       std::string& error);

} // namespace argsmap::argsapt
