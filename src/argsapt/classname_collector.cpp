#include "argsapt/classname_collector.hpp"

#include <algorithm>

namespace argsmap::argsapt {

std::string SourcePathToClassName(std::string_view source_path, build::Language language) {
  const std::string_view extension = build::SourceExtension(language);
  if (source_path.ends_with(extension)) {
    source_path.remove_suffix(extension.size());
  }

  std::string class_name(source_path);
  std::replace(class_name.begin(), class_name.end(), '/', '.');
  return class_name;
}

ClassNameSet CollectClassNames(const build::IBuildUnit& binary) {
  ClassNameSet class_names;
  build::WalkTransitive(
      binary, [](const build::IBuildUnit& unit) { return unit.IsInternal(); },
      [&class_names](const build::IBuildUnit& unit) {
        if (!unit.IsSourceLanguage(build::Language::kJava)) {
          return;
        }
        for (const std::string& source : unit.Sources()) {
          class_names.insert(SourcePathToClassName(source, build::Language::kJava));
        }
      });
  return class_names;
}

} // namespace argsmap::argsapt
