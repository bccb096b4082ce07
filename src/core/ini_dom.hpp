#ifndef ARGSMAP_CORE_INI_DOM_HPP_
#define ARGSMAP_CORE_INI_DOM_HPP_

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace argsmap::core::ini {

struct Entry {
  std::string key;
  std::string value;
  std::size_t line = 0;
};

// `[unit src/java/com/foo:main]` parses to kind "unit" and argument
// "src/java/com/foo:main". Sections without an argument leave it empty.
struct Section {
  std::string kind;
  std::string argument;
  std::size_t line = 0;
  std::vector<Entry> entries;

  const Entry* Find(std::string_view key) const {
    for (const Entry& entry : entries) {
      if (entry.key == key) {
        return &entry;
      }
    }
    return nullptr;
  }
};

struct Document {
  std::vector<Section> sections;
};

// Line-oriented parser for build plan files.
//
// Accepted syntax:
// - `#` or `;` at line start, or after whitespace, starts a comment
// - `[kind]` or `[kind argument]` opens a section
// - `key = value` adds an entry to the open section
// - an indented line continues the previous entry's value
// Errors carry the 1-based line number of the offending input.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Document& document, std::string& error) {
    document = Document{};

    while (!AtEnd()) {
      const std::string_view raw_line = NextLine();
      const bool indented =
          !raw_line.empty() && (raw_line.front() == ' ' || raw_line.front() == '\t');
      const std::string_view content = Trim(StripComment(raw_line));
      if (content.empty()) {
        continue;
      }

      if (content.front() == '[') {
        if (!ParseSectionHeader(content, document, error)) {
          return false;
        }
        continue;
      }

      if (indented && last_entry_ != nullptr) {
        last_entry_->value.push_back(' ');
        last_entry_->value.append(content);
        continue;
      }

      if (!ParseEntry(content, document, error)) {
        return false;
      }
    }

    return true;
  }

private:
  bool ParseSectionHeader(std::string_view content, Document& document, std::string& error) {
    if (content.back() != ']') {
      return Fail("expected ']' to close section header", error);
    }

    const std::string_view inner = Trim(content.substr(1, content.size() - 2));
    if (inner.empty()) {
      return Fail("section header cannot be empty", error);
    }

    Section section;
    section.line = line_;
    const std::size_t split = inner.find_first_of(" \t");
    if (split == std::string_view::npos) {
      section.kind = std::string(inner);
    } else {
      section.kind = std::string(inner.substr(0, split));
      section.argument = std::string(Trim(inner.substr(split)));
    }

    document.sections.push_back(std::move(section));
    last_entry_ = nullptr;
    return true;
  }

  bool ParseEntry(std::string_view content, Document& document, std::string& error) {
    if (document.sections.empty()) {
      return Fail("entry appears before any section header", error);
    }

    const std::size_t equals = content.find('=');
    if (equals == std::string_view::npos) {
      return Fail("expected 'key = value'", error);
    }

    const std::string_view key = Trim(content.substr(0, equals));
    if (key.empty()) {
      return Fail("entry key cannot be empty", error);
    }

    Section& section = document.sections.back();
    if (section.Find(key) != nullptr) {
      return Fail("duplicate key '" + std::string(key) + "' in section [" + section.kind + "]",
                  error);
    }

    Entry entry;
    entry.key = std::string(key);
    entry.value = std::string(Trim(content.substr(equals + 1)));
    entry.line = line_;
    section.entries.push_back(std::move(entry));
    last_entry_ = &section.entries.back();
    return true;
  }

  std::string_view NextLine() {
    ++line_;
    const std::size_t end = input_.find('\n', pos_);
    std::string_view line;
    if (end == std::string_view::npos) {
      line = input_.substr(pos_);
      pos_ = input_.size();
    } else {
      line = input_.substr(pos_, end - pos_);
      pos_ = end + 1;
    }
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    return line;
  }

  static std::string_view StripComment(std::string_view line) {
    for (std::size_t i = 0; i < line.size(); ++i) {
      if (line[i] != '#' && line[i] != ';') {
        continue;
      }
      if (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t') {
        return line.substr(0, i);
      }
    }
    return line;
  }

  static std::string_view Trim(std::string_view text) {
    constexpr std::string_view kWhitespace = " \t";
    const std::size_t first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
      return {};
    }
    const std::size_t last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 0;
  Entry* last_entry_ = nullptr;
};

inline bool Parse(std::string_view input, Document& document, std::string& error) {
  Parser parser(input);
  return parser.Parse(document, error);
}

} // namespace argsmap::core::ini

#endif // ARGSMAP_CORE_INI_DOM_HPP_
