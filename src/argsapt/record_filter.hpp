#pragma once

#include "argsapt/classname_collector.hpp"
#include "argsapt/resource_scanner.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace argsmap::argsapt {

// True for keynames whose records are tied to one class (`field`,
// `positional`).
bool IsClassScopedKeyname(std::string_view keyname);

// Decides whether one record belongs in a binary whose reachable classes are
// `class_names`.
//
// - Blank records are dropped.
// - Records with any keyname other than `field`/`positional` are kept.
// - `field`/`positional` records are kept iff their second space-delimited
//   token is in `class_names`.
// Returns false with `error` naming the record when a class-scoped record has
// no second token at all.
bool ShouldKeepRecord(std::string_view record, const ClassNameSet& class_names, bool& keep,
                      std::string& error);

// Applies ShouldKeepRecord() to every record, or keeps everything when
// `include_all` is set. Output order follows `records`.
bool FilterArgsRecords(const RecordSet& records, const ClassNameSet& class_names,
                       bool include_all, std::vector<std::string>& kept, std::string& error);

} // namespace argsmap::argsapt
