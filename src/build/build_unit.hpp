#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace argsmap::build {

enum class Language {
  kJava,
  kScala,
};

enum class UnitType {
  kJvmBinary,
  kJavaLibrary,
  kScalaLibrary,
  kJarLibrary,
};

const char* ToString(Language language);
const char* ToString(UnitType type);

// Source-file suffix for a language, including the leading dot.
std::string_view SourceExtension(Language language);

bool ParseLanguage(std::string_view raw, Language& language, std::string& error);
bool ParseUnitType(std::string_view raw, UnitType& type, std::string& error);

// Read-only view of one node in the build graph.
//
// The mapper only asks capability questions. It never branches on concrete
// unit types, so alternate graph providers only need to implement this
// interface.
class IBuildUnit {
public:
  virtual ~IBuildUnit() = default;

  // Stable address of the unit, e.g. `src/java/com/foo:main`.
  virtual const std::string& Id() const = 0;

  // True for units packaged into a runnable archive.
  virtual bool IsBinary() const = 0;

  // True for first-party units; third-party jars are not internal.
  virtual bool IsInternal() const = 0;

  // True when the unit is declared in `language` or owns at least one source
  // with that language's extension.
  virtual bool IsSourceLanguage(Language language) const = 0;

  // Source paths relative to the unit's source root, in declared order.
  virtual const std::vector<std::string>& Sources() const = 0;

  // Direct dependencies in declared order.
  virtual const std::vector<const IBuildUnit*>& Dependencies() const = 0;
};

using UnitPredicate = std::function<bool(const IBuildUnit&)>;
using UnitVisitor = std::function<void(const IBuildUnit&)>;

// Depth-first, pre-order walk of `root` and its transitive dependencies.
//
// - `root` is always visited.
// - A dependency is visited, and descended into, only if `predicate` accepts it.
// - Every unit is visited at most once, so cycles terminate.
// - Siblings are visited in declared order.
void WalkTransitive(const IBuildUnit& root, const UnitPredicate& predicate,
                    const UnitVisitor& visitor);

} // namespace argsmap::build
