#ifndef ARGSMAP_BUILD_JAR_PRODUCTS_HPP_
#define ARGSMAP_BUILD_JAR_PRODUCTS_HPP_

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace argsmap::build {

// Archives produced for one unit, grouped by output base directory.
// Base directories keep the order in which they were first registered.
struct JarMapping {
  std::vector<std::pair<std::filesystem::path, std::vector<std::string>>> by_base_dir;

  bool Empty() const {
    return by_base_dir.empty();
  }
};

// Product map written by the jar-producing step and read by the mapper:
// unit id -> {base_dir: [jar names relative to base_dir]}.
class JarProducts {
public:
  void Add(std::string_view unit_id, const std::filesystem::path& base_dir, std::string jar);

  // Returns nullptr when the unit produced no jars.
  const JarMapping* Get(std::string_view unit_id) const;

  // Unit ids with at least one registered jar, sorted.
  std::vector<std::string> UnitIds() const;

private:
  std::map<std::string, JarMapping, std::less<>> mappings_;
};

} // namespace argsmap::build

#endif // ARGSMAP_BUILD_JAR_PRODUCTS_HPP_
