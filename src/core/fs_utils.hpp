#ifndef ARGSMAP_CORE_FS_UTILS_HPP_
#define ARGSMAP_CORE_FS_UTILS_HPP_

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace argsmap::core {

inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read text file: " + path.string();
    return false;
  }

  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading text file: " + path.string();
    return false;
  }
  return true;
}

// Splits text into lines without their terminators. Both `\n` and `\r\n` end a
// line; a trailing terminator does not produce an extra empty line.
inline std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.emplace_back(line);
    start = end + 1;
  }
  return lines;
}

inline std::string_view TrimWhitespace(std::string_view text) {
  constexpr std::string_view kWhitespace = " \t\r\n\f\v";
  const std::size_t first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const std::size_t last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

// Relative paths in a build plan are anchored at the plan file's directory so
// a plan behaves the same regardless of the caller's working directory.
inline std::filesystem::path ResolveAgainst(const std::filesystem::path& base_dir,
                                            const std::filesystem::path& path) {
  if (path.is_absolute() || base_dir.empty()) {
    return path;
  }
  return (base_dir / path).lexically_normal();
}

} // namespace argsmap::core

#endif // ARGSMAP_CORE_FS_UTILS_HPP_
