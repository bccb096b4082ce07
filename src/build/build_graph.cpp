#include "build/build_graph.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace argsmap::build {

const char* ToString(Language language) {
  switch (language) {
  case Language::kJava:
    return "java";
  case Language::kScala:
    return "scala";
  }
  return "java";
}

const char* ToString(UnitType type) {
  switch (type) {
  case UnitType::kJvmBinary:
    return "jvm_binary";
  case UnitType::kJavaLibrary:
    return "java_library";
  case UnitType::kScalaLibrary:
    return "scala_library";
  case UnitType::kJarLibrary:
    return "jar_library";
  }
  return "java_library";
}

std::string_view SourceExtension(Language language) {
  switch (language) {
  case Language::kJava:
    return ".java";
  case Language::kScala:
    return ".scala";
  }
  return ".java";
}

bool ParseLanguage(std::string_view raw, Language& language, std::string& error) {
  if (raw == "java") {
    language = Language::kJava;
    return true;
  }
  if (raw == "scala") {
    language = Language::kScala;
    return true;
  }
  error = "unknown language '" + std::string(raw) + "' (expected java|scala)";
  return false;
}

bool ParseUnitType(std::string_view raw, UnitType& type, std::string& error) {
  for (const UnitType candidate : {UnitType::kJvmBinary, UnitType::kJavaLibrary,
                                   UnitType::kScalaLibrary, UnitType::kJarLibrary}) {
    if (raw == ToString(candidate)) {
      type = candidate;
      return true;
    }
  }
  error = "unknown unit type '" + std::string(raw) +
          "' (expected jvm_binary|java_library|scala_library|jar_library)";
  return false;
}

void WalkTransitive(const IBuildUnit& root, const UnitPredicate& predicate,
                    const UnitVisitor& visitor) {
  std::unordered_set<const IBuildUnit*> visited;
  std::vector<const IBuildUnit*> pending = {&root};

  while (!pending.empty()) {
    const IBuildUnit* unit = pending.back();
    pending.pop_back();
    if (!visited.insert(unit).second) {
      continue;
    }

    visitor(*unit);

    const auto& dependencies = unit->Dependencies();
    for (auto it = dependencies.rbegin(); it != dependencies.rend(); ++it) {
      const IBuildUnit* dependency = *it;
      if (dependency == nullptr || visited.count(dependency) != 0U) {
        continue;
      }
      if (predicate && !predicate(*dependency)) {
        continue;
      }
      pending.push_back(dependency);
    }
  }
}

BuildUnit::BuildUnit(BuildUnitSpec spec) : spec_(std::move(spec)) {}

const std::string& BuildUnit::Id() const {
  return spec_.id;
}

bool BuildUnit::IsBinary() const {
  return spec_.type == UnitType::kJvmBinary;
}

bool BuildUnit::IsInternal() const {
  if (spec_.internal.has_value()) {
    return *spec_.internal;
  }
  return spec_.type != UnitType::kJarLibrary;
}

bool BuildUnit::IsSourceLanguage(Language language) const {
  if (spec_.language.has_value() && *spec_.language == language) {
    return true;
  }
  if (language == Language::kJava && spec_.type == UnitType::kJavaLibrary) {
    return true;
  }
  if (language == Language::kScala && spec_.type == UnitType::kScalaLibrary) {
    return true;
  }

  // Binaries may carry sources of either language, so fall back to the files.
  const std::string_view extension = SourceExtension(language);
  return std::any_of(spec_.sources.begin(), spec_.sources.end(),
                     [extension](const std::string& source) {
                       return std::string_view(source).ends_with(extension);
                     });
}

const std::vector<std::string>& BuildUnit::Sources() const {
  return spec_.sources;
}

const std::vector<const IBuildUnit*>& BuildUnit::Dependencies() const {
  return dependencies_;
}

bool BuildGraph::AddUnit(BuildUnitSpec spec, std::string& error) {
  if (spec.id.empty()) {
    error = "unit id cannot be empty";
    return false;
  }
  if (by_id_.find(spec.id) != by_id_.end()) {
    error = "duplicate unit id: " + spec.id;
    return false;
  }

  auto unit = std::make_unique<BuildUnit>(std::move(spec));
  by_id_.emplace(unit->Id(), unit.get());
  units_.push_back(std::move(unit));
  return true;
}

bool BuildGraph::Link(std::string& error) {
  for (auto& unit : units_) {
    unit->dependencies_.clear();
    unit->dependencies_.reserve(unit->spec_.dependency_ids.size());
    for (const std::string& dependency_id : unit->spec_.dependency_ids) {
      const auto it = by_id_.find(dependency_id);
      if (it == by_id_.end()) {
        error = "unit " + unit->Id() + " depends on undefined unit: " + dependency_id;
        return false;
      }
      unit->dependencies_.push_back(it->second);
    }
  }
  return true;
}

const BuildUnit* BuildGraph::Find(std::string_view id) const {
  const auto it = by_id_.find(id);
  if (it == by_id_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<const BuildUnit*> BuildGraph::Units() const {
  std::vector<const BuildUnit*> units;
  units.reserve(units_.size());
  for (const auto& unit : units_) {
    units.push_back(unit.get());
  }
  return units;
}

} // namespace argsmap::build
