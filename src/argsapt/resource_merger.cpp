#include "argsapt/resource_merger.hpp"

#include "argsapt/args_resource.hpp"
#include "artifacts/zip_appender.hpp"

#include <algorithm>

namespace fs = std::filesystem;

namespace argsmap::argsapt {

std::string RenderArgsResource(std::vector<std::string> records, std::string_view header) {
  std::stable_sort(records.begin(), records.end());

  std::size_t total_size = header.size() + 1U;
  for (const std::string& record : records) {
    total_size += record.size() + 1U;
  }

  std::string content;
  content.reserve(total_size);
  content.append(header);
  content.push_back('\n');
  for (const std::string& record : records) {
    content += record;
    content.push_back('\n');
  }
  return content;
}

bool MergeArgsResource(const fs::path& archive_path, const std::vector<std::string>& records,
                       std::string_view entry_path, std::string_view header, MergeResult& result,
                       std::string& error) {
  result = MergeResult{};
  if (records.empty()) {
    error = "refusing to merge an empty args resource into " + archive_path.string();
    return false;
  }

  artifacts::ZipAppender archive;
  if (!archive.Open(archive_path, error)) {
    return false;
  }

  result.had_existing_entry = archive.HasEntry(entry_path);
  if (!archive.AddEntry(std::string(entry_path), RenderArgsResource(records, header), error)) {
    return false;
  }
  if (!archive.Commit(error)) {
    return false;
  }

  result.record_count = records.size();
  return true;
}

bool MergeArgsResource(const fs::path& archive_path, const std::vector<std::string>& records,
                       MergeResult& result, std::string& error) {
  return MergeArgsResource(archive_path, records, kArgsResourceEntryPath, kArgsResourceHeader,
                           result, error);
}

} // namespace argsmap::argsapt
