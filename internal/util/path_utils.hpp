#pragma once

#include <cctype>
#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace coord::util {

// Names that end up as a single path component (lock resources, labels, ids).
inline void ValidateComponent(const std::string& name, const char* what) {
  if (name.empty()) {
    throw ValidationFailed(std::string(what) + " must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw ValidationFailed(std::string(what) + " contains invalid character: " + name);
    }
  }
  if (name == "." || name == "..") {
    throw ValidationFailed(std::string(what) + " must not be a relative path component");
  }
}

// Lowercased, [a-z0-9._-] kept, other runs collapsed into '-'.
inline std::string Sanitize(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  bool dash = false;
  for (char c : raw) {
    const auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if ((lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9') || lower == '.' || lower == '_' || lower == '-') {
      out.push_back(lower);
      dash = false;
      continue;
    }
    if (!dash) out.push_back('-');
    dash = true;
  }
  while (!out.empty() && (out.front() == '-' || out.front() == '.')) out.erase(out.begin());
  while (!out.empty() && out.back() == '-') out.pop_back();
  return out;
}

// Resolves relative paths against base; absolute paths are returned unchanged.
inline std::filesystem::path ResolveAgainst(const std::filesystem::path& base, const std::string& value) {
  std::filesystem::path path(value);
  if (path.is_absolute()) return path;
  return base / path;
}

} // namespace coord::util
