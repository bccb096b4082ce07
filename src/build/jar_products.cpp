#include "build/jar_products.hpp"

namespace fs = std::filesystem;

namespace argsmap::build {

void JarProducts::Add(std::string_view unit_id, const fs::path& base_dir, std::string jar) {
  auto it = mappings_.find(unit_id);
  if (it == mappings_.end()) {
    it = mappings_.emplace(std::string(unit_id), JarMapping{}).first;
  }

  auto& by_base_dir = it->second.by_base_dir;
  for (auto& [existing_base_dir, jars] : by_base_dir) {
    if (existing_base_dir == base_dir) {
      jars.push_back(std::move(jar));
      return;
    }
  }
  by_base_dir.emplace_back(base_dir, std::vector<std::string>{std::move(jar)});
}

const JarMapping* JarProducts::Get(std::string_view unit_id) const {
  const auto it = mappings_.find(unit_id);
  if (it == mappings_.end() || it->second.Empty()) {
    return nullptr;
  }
  return &it->second;
}

std::vector<std::string> JarProducts::UnitIds() const {
  std::vector<std::string> ids;
  ids.reserve(mappings_.size());
  for (const auto& [id, mapping] : mappings_) {
    if (!mapping.Empty()) {
      ids.push_back(id);
    }
  }
  return ids;
}

} // namespace argsmap::build
