#include "build/build_plan.hpp"

#include "core/fs_utils.hpp"
#include "core/ini_dom.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <utility>

namespace fs = std::filesystem;

namespace argsmap::build {

namespace {

constexpr std::string_view kTaskSection = "args-apt";
constexpr std::string_view kUnitSection = "unit";
constexpr std::string_view kJarsSection = "jars";

std::string AtLine(std::size_t line) {
  return "line " + std::to_string(line) + ": ";
}

std::vector<std::string> SplitList(std::string_view value) {
  std::vector<std::string> items;
  std::size_t pos = 0;
  while (pos < value.size()) {
    while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos])) != 0) {
      ++pos;
    }
    const std::size_t start = pos;
    while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos])) == 0) {
      ++pos;
    }
    if (pos > start) {
      items.emplace_back(value.substr(start, pos - start));
    }
  }
  return items;
}

bool ParseBool(const core::ini::Entry& entry, bool& value, std::string& error) {
  std::string normalized = entry.value;
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "true" || normalized == "yes" || normalized == "1") {
    value = true;
    return true;
  }
  if (normalized == "false" || normalized == "no" || normalized == "0") {
    value = false;
    return true;
  }
  error = AtLine(entry.line) + "invalid boolean for '" + entry.key + "': '" + entry.value +
          "' (expected true|false)";
  return false;
}

bool RejectUnknownKeys(const core::ini::Section& section,
                       std::initializer_list<std::string_view> allowed, std::string& error) {
  for (const core::ini::Entry& entry : section.entries) {
    if (std::find(allowed.begin(), allowed.end(), entry.key) == allowed.end()) {
      error = AtLine(entry.line) + "unknown key '" + entry.key + "' in [" + section.kind + "]";
      return false;
    }
  }
  return true;
}

bool ParseTaskSection(const core::ini::Section& section, const fs::path& base_dir,
                      BuildPlan& plan, std::string& error) {
  if (!section.argument.empty()) {
    error = AtLine(section.line) + "[" + section.kind + "] does not take an argument";
    return false;
  }
  if (!RejectUnknownKeys(section, {"classdirs", "include_all"}, error)) {
    return false;
  }

  if (const core::ini::Entry* entry = section.Find("classdirs"); entry != nullptr) {
    for (const std::string& classdir : SplitList(entry->value)) {
      plan.classdirs.push_back(core::ResolveAgainst(base_dir, classdir));
    }
  }
  if (const core::ini::Entry* entry = section.Find("include_all"); entry != nullptr) {
    if (!ParseBool(*entry, plan.include_all, error)) {
      return false;
    }
  }
  return true;
}

bool ParseUnitSection(const core::ini::Section& section, BuildPlan& plan, std::string& error) {
  if (section.argument.empty()) {
    error = AtLine(section.line) + "[unit] requires a unit id";
    return false;
  }
  if (!RejectUnknownKeys(section, {"type", "language", "sources", "dependencies", "internal"},
                         error)) {
    return false;
  }

  BuildUnitSpec spec;
  spec.id = section.argument;

  const core::ini::Entry* type_entry = section.Find("type");
  if (type_entry == nullptr) {
    error = AtLine(section.line) + "unit " + spec.id + " is missing required key 'type'";
    return false;
  }
  if (!ParseUnitType(type_entry->value, spec.type, error)) {
    error = AtLine(type_entry->line) + error;
    return false;
  }

  if (const core::ini::Entry* entry = section.Find("language"); entry != nullptr) {
    Language language = Language::kJava;
    if (!ParseLanguage(entry->value, language, error)) {
      error = AtLine(entry->line) + error;
      return false;
    }
    spec.language = language;
  }
  if (const core::ini::Entry* entry = section.Find("internal"); entry != nullptr) {
    bool internal = true;
    if (!ParseBool(*entry, internal, error)) {
      return false;
    }
    spec.internal = internal;
  }
  if (const core::ini::Entry* entry = section.Find("sources"); entry != nullptr) {
    spec.sources = SplitList(entry->value);
  }
  if (const core::ini::Entry* entry = section.Find("dependencies"); entry != nullptr) {
    spec.dependency_ids = SplitList(entry->value);
  }

  if (!plan.graph.AddUnit(std::move(spec), error)) {
    error = AtLine(section.line) + error;
    return false;
  }
  return true;
}

bool ParseJarsSection(const core::ini::Section& section, const fs::path& base_dir,
                      BuildPlan& plan, std::string& error) {
  if (section.argument.empty()) {
    error = AtLine(section.line) + "[jars] requires a unit id";
    return false;
  }

  for (const core::ini::Entry& entry : section.entries) {
    const std::vector<std::string> jar_names = SplitList(entry.value);
    if (jar_names.empty()) {
      error = AtLine(entry.line) + "no jars listed for base directory '" + entry.key + "'";
      return false;
    }
    const fs::path jar_base_dir = core::ResolveAgainst(base_dir, entry.key);
    for (const std::string& jar_name : jar_names) {
      plan.jars.Add(section.argument, jar_base_dir, jar_name);
    }
  }
  return true;
}

} // namespace

bool ParseBuildPlanText(std::string_view text, const fs::path& base_dir, BuildPlan& plan,
                        std::string& error) {
  plan = BuildPlan{};

  core::ini::Document document;
  if (!core::ini::Parse(text, document, error)) {
    return false;
  }

  // Jar sections may precede the units they describe; check them at the end.
  std::vector<std::pair<std::string, std::size_t>> jar_owners;
  bool saw_task_section = false;

  for (const core::ini::Section& section : document.sections) {
    if (section.kind == kTaskSection) {
      if (saw_task_section) {
        error = AtLine(section.line) + "duplicate [args-apt] section";
        return false;
      }
      saw_task_section = true;
      if (!ParseTaskSection(section, base_dir, plan, error)) {
        return false;
      }
    } else if (section.kind == kUnitSection) {
      if (!ParseUnitSection(section, plan, error)) {
        return false;
      }
    } else if (section.kind == kJarsSection) {
      if (!ParseJarsSection(section, base_dir, plan, error)) {
        return false;
      }
      jar_owners.emplace_back(section.argument, section.line);
    } else {
      error = AtLine(section.line) + "unknown section [" + section.kind + "]";
      return false;
    }
  }

  for (const auto& [unit_id, line] : jar_owners) {
    if (plan.graph.Find(unit_id) == nullptr) {
      error = AtLine(line) + "jars declared for undefined unit: " + unit_id;
      return false;
    }
  }

  return plan.graph.Link(error);
}

bool LoadBuildPlanFile(const fs::path& plan_path, BuildPlan& plan, std::string& error) {
  std::error_code ec;
  if (!fs::exists(plan_path, ec) || ec) {
    error = "build plan not found: " + plan_path.string();
    return false;
  }
  if (!fs::is_regular_file(plan_path, ec) || ec) {
    error = "build plan must be a regular file: " + plan_path.string();
    return false;
  }

  std::string text;
  if (!core::ReadTextFile(plan_path, text, error)) {
    return false;
  }

  const fs::path base_dir = plan_path.parent_path();
  if (!ParseBuildPlanText(text, base_dir, plan, error)) {
    error = plan_path.string() + ": " + error;
    return false;
  }
  return true;
}

} // namespace argsmap::build
