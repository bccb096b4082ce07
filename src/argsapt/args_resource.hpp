#pragma once

#include <string_view>

namespace argsmap::argsapt {

// Layout shared with the args annotation processor and the runtime parser
// that reads the merged resource back out of the binary.
inline constexpr std::string_view kArgsResourceDir = "com/twitter/common/args/apt";
inline constexpr std::string_view kArgsResourceBasename = "cmdline.arg.info.txt";

// The processor numbers its outputs from `.0`; the merged resource takes the
// first slot so the runtime finds one family member per binary.
inline constexpr std::string_view kArgsResourceEntryPath =
    "com/twitter/common/args/apt/cmdline.arg.info.txt.0";

inline constexpr std::string_view kArgsResourceHeader = "# Created by pants goal binary:args-apt";

// Record keynames whose second token names the owning class.
inline constexpr std::string_view kFieldKeyname = "field";
inline constexpr std::string_view kPositionalKeyname = "positional";

} // namespace argsmap::argsapt
