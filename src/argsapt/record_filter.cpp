#include "argsapt/record_filter.hpp"

#include "argsapt/args_resource.hpp"
#include "core/fs_utils.hpp"

namespace argsmap::argsapt {

bool IsClassScopedKeyname(std::string_view keyname) {
  return keyname == kFieldKeyname || keyname == kPositionalKeyname;
}

bool ShouldKeepRecord(std::string_view record, const ClassNameSet& class_names, bool& keep,
                      std::string& error) {
  const std::string_view trimmed = core::TrimWhitespace(record);
  if (trimmed.empty()) {
    keep = false;
    return true;
  }

  const std::size_t keyname_end = trimmed.find(' ');
  const std::string_view keyname = trimmed.substr(0, keyname_end);
  if (!IsClassScopedKeyname(keyname)) {
    keep = true;
    return true;
  }

  if (keyname_end == std::string_view::npos) {
    error = "malformed args record, missing class name: '" + std::string(record) + "'";
    return false;
  }
  const std::string_view rest = trimmed.substr(keyname_end + 1);
  // A doubled space yields an empty class token, which never matches.
  const std::string_view class_name = rest.substr(0, rest.find(' '));
  keep = class_names.find(class_name) != class_names.end();
  return true;
}

bool FilterArgsRecords(const RecordSet& records, const ClassNameSet& class_names,
                       bool include_all, std::vector<std::string>& kept, std::string& error) {
  kept.clear();
  if (include_all) {
    kept.assign(records.begin(), records.end());
    return true;
  }

  for (const std::string& record : records) {
    bool keep = false;
    if (!ShouldKeepRecord(record, class_names, keep, error)) {
      kept.clear();
      return false;
    }
    if (keep) {
      kept.push_back(record);
    }
  }
  return true;
}

} // namespace argsmap::argsapt
