#pragma once

#include "build/build_unit.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace argsmap::build {

// Declaration of one unit before dependency ids are resolved.
struct BuildUnitSpec {
  std::string id;
  UnitType type = UnitType::kJavaLibrary;
  std::optional<Language> language;
  std::optional<bool> internal;
  std::vector<std::string> sources;
  std::vector<std::string> dependency_ids;
};

class BuildUnit final : public IBuildUnit {
public:
  explicit BuildUnit(BuildUnitSpec spec);

  const std::string& Id() const override;
  bool IsBinary() const override;
  bool IsInternal() const override;
  bool IsSourceLanguage(Language language) const override;
  const std::vector<std::string>& Sources() const override;
  const std::vector<const IBuildUnit*>& Dependencies() const override;

  UnitType Type() const {
    return spec_.type;
  }

  const std::vector<std::string>& DependencyIds() const {
    return spec_.dependency_ids;
  }

private:
  friend class BuildGraph;

  BuildUnitSpec spec_;
  std::vector<const IBuildUnit*> dependencies_;
};

// In-memory build graph owning its units.
//
// Usage: AddUnit() for every declaration, then Link() once to resolve
// dependency ids. Units keep stable addresses for the graph's lifetime.
class BuildGraph {
public:
  BuildGraph() = default;
  BuildGraph(const BuildGraph&) = delete;
  BuildGraph& operator=(const BuildGraph&) = delete;
  BuildGraph(BuildGraph&&) = default;
  BuildGraph& operator=(BuildGraph&&) = default;

  // Fails on empty or duplicate ids.
  bool AddUnit(BuildUnitSpec spec, std::string& error);

  // Resolves every dependency id. Fails on the first id that names no unit.
  bool Link(std::string& error);

  const BuildUnit* Find(std::string_view id) const;

  // Units in declaration order.
  std::vector<const BuildUnit*> Units() const;

  std::size_t Size() const {
    return units_.size();
  }

private:
  std::vector<std::unique_ptr<BuildUnit>> units_;
  std::map<std::string, BuildUnit*, std::less<>> by_id_;
};

} // namespace argsmap::build
