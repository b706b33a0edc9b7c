#include "SanitizerLogic.h"

#include <cstddef>
#include <filesystem>
#include <regex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace // Anonymous namespace for internal linkage helper functions
{
constexpr char32_t kInvalidCodePoint = 0xFFFFFFFF;
constexpr char32_t kMultiplicationSign = 0x00D7;

// Decodes the UTF-8 sequence starting at 'pos'. Malformed input is reported as
// kInvalidCodePoint with a length of one byte so it is copied through as-is
std::pair<char32_t, std::size_t> decode_code_point(std::string_view text,
                                                   std::size_t pos) noexcept {
  const unsigned char lead = static_cast<unsigned char>(text[pos]);
  if (lead < 0x80) {
    return {lead, 1};
  }
  std::size_t length = 0;
  char32_t cp = 0;
  if ((lead & 0xE0) == 0xC0) {
    length = 2;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    cp = lead & 0x07;
  } else {
    return {kInvalidCodePoint, 1};
  }
  if (pos + length > text.size()) {
    return {kInvalidCodePoint, 1};
  }
  for (std::size_t i = 1; i < length; ++i) {
    const unsigned char cont = static_cast<unsigned char>(text[pos + i]);
    if ((cont & 0xC0) != 0x80) {
      return {kInvalidCodePoint, 1};
    }
    cp = (cp << 6) | (cont & 0x3F);
  }
  return {cp, length};
}

// Unicode White_Space property
bool is_whitespace(char32_t cp) noexcept {
  return (cp >= 0x09 && cp <= 0x0D) || cp == 0x20 || cp == 0x85 ||
         cp == 0xA0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) ||
         cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F ||
         cp == 0x3000;
}

// Characters that never survive into a sanitized name
bool is_unsafe(char32_t cp) noexcept {
  if (cp == kInvalidCodePoint) {
    return false;
  }
  if (is_whitespace(cp)) {
    return true;
  }
  constexpr std::u32string_view punctuation = U".,\":?'#;&*\\()[]";
  return punctuation.find(cp) != std::u32string_view::npos;
}

// Escapes 'text' for use as the format argument of std::regex_replace
std::string escape_regex_format(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '$') {
      out += '$'; // "$$" yields a literal dollar sign
    }
    out += c;
  }
  return out;
}
} // namespace

// Ensures 'input' is treated as a literal string within a regex pattern by
// escaping metacharacters
std::string SanitizerLogic::EscapeRegexChars(const std::string &input) {
  static const std::regex regex_escape_chars(R"([.^$|()\[\]{}+*?\\])");
  return std::regex_replace(input, regex_escape_chars, R"(\$&)");
}

bool SanitizerLogic::IsHidden(std::string_view baseName) {
  return !baseName.empty() && baseName.front() == '.';
}

// Directories and dotfiles never carry an extension, and a trailing dot
// ("name.") leaves nothing to preserve
bool SanitizerLogic::HasExtension(std::string_view baseName, bool isDirectory) {
  if (isDirectory || IsHidden(baseName)) {
    return false;
  }
  const std::size_t last_dot_pos = baseName.find_last_of('.');
  return last_dot_pos != std::string_view::npos &&
         last_dot_pos + 1 < baseName.size();
}

std::string SanitizerLogic::ExtractExtension(std::string_view baseName,
                                             bool isDirectory) {
  if (!HasExtension(baseName, isDirectory)) {
    return std::string();
  }
  return std::string(baseName.substr(baseName.find_last_of('.') + 1));
}

// Reduces every run of two or more replacement characters to a single one
std::string
SanitizerLogic::CollapseReplacementRuns(const std::string &text,
                                        const std::string &replacement) {
  if (replacement.empty() || text.empty()) {
    return text;
  }
  const std::regex runs("(?:" + EscapeRegexChars(replacement) + "){2,}");
  return std::regex_replace(text, runs, escape_regex_format(replacement));
}

// Maps one base name to its safe form. The trailing "<replacement><extension>"
// left behind by the dot substitution is dropped so the caller can re-attach
// the untouched extension
std::string SanitizerLogic::SanitizeComponent(std::string_view name,
                                              const std::string &replacement,
                                              const std::string &extension) {
  std::string mapped;
  mapped.reserve(name.size());
  for (std::size_t pos = 0; pos < name.size();) {
    const auto [cp, length] = decode_code_point(name, pos);
    if (cp == kMultiplicationSign) {
      mapped += 'x';
    } else if (is_unsafe(cp)) {
      mapped += replacement;
    } else {
      mapped.append(name.data() + pos, length);
    }
    pos += length;
  }

  std::string collapsed = CollapseReplacementRuns(mapped, replacement);

  if (!extension.empty()) {
    const std::string suffix = replacement + extension;
    if (collapsed.size() >= suffix.size() &&
        collapsed.compare(collapsed.size() - suffix.size(), suffix.size(),
                          suffix) == 0) {
      collapsed.erase(collapsed.size() - suffix.size());
    }
  }
  return collapsed;
}

// Sanitizes only the final component of 'path'; the directory prefix is kept
// byte for byte
std::string SanitizerLogic::SanitizedFilename(const std::string &path,
                                              const std::string &replacement,
                                              bool isDirectory) {
  std::string_view trimmed(path);
  while (trimmed.size() > 1 && trimmed.back() == '/') {
    trimmed.remove_suffix(1);
  }

  const std::size_t slash_pos = trimmed.find_last_of('/');
  const std::string_view directory =
      (slash_pos == std::string_view::npos) ? std::string_view()
                                            : trimmed.substr(0, slash_pos + 1);
  const std::string_view base_name =
      (slash_pos == std::string_view::npos) ? trimmed
                                            : trimmed.substr(slash_pos + 1);

  // Nothing to rename for the root, "." or ".."
  if (base_name.empty() || base_name == "." || base_name == "..") {
    return path;
  }

  const std::string extension = ExtractExtension(base_name, isDirectory);
  std::string result(directory);
  result += SanitizeComponent(base_name, replacement, extension);
  if (!extension.empty()) {
    result += '.';
    result += extension;
  }
  return result;
}

// Classifies 'path' through the filesystem (following symbolic links, so a link
// to a directory is treated as a directory) before sanitizing it
std::string SanitizerLogic::SanitizedFilename(const std::string &path,
                                              const std::string &replacement) {
  std::error_code ec;
  const bool isDirectory = fs::is_directory(path, ec);
  return SanitizedFilename(path, replacement, isDirectory && !ec);
}
