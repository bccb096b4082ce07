#pragma once

#include "build/build_unit.hpp"

#include <functional>
#include <set>
#include <string>
#include <string_view>

namespace argsmap::argsapt {

using ClassNameSet = std::set<std::string, std::less<>>;

// `com/foo/Main.java` -> `com.foo.Main`. The extension is removed only when it
// matches `language`.
std::string SourcePathToClassName(std::string_view source_path,
                                  build::Language language = build::Language::kJava);

// Collects the class names of every Java source reachable from `binary`
// through internal units, the binary itself included.
ClassNameSet CollectClassNames(const build::IBuildUnit& binary);

} // namespace argsmap::argsapt
