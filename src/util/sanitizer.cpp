#include "util/sanitizer.hpp"

namespace tutor {
namespace util {

namespace {

bool is_separator_or_space(unsigned char c) {
  return c == '/' || c == '\\' || c == ' ' || c == '\t' || c == '\n' ||
         c == '\r' || c == '\v' || c == '\f';
}

bool is_allowed(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-';
}

} // namespace

std::string sanitize(const std::string& segment) {
  // Split on separators and whitespace, rejoin the words with underscores
  std::string joined;
  joined.reserve(segment.size());
  bool pending_gap = false;
  for (unsigned char c : segment) {
    if (c >= 0x80) {
      continue;
    }
    if (is_separator_or_space(c)) {
      pending_gap = !joined.empty();
      continue;
    }
    if (pending_gap) {
      joined.push_back('_');
      pending_gap = false;
    }
    joined.push_back(static_cast<char>(c));
  }

  // Drop everything outside the allowed set
  std::string filtered;
  filtered.reserve(joined.size());
  for (unsigned char c : joined) {
    if (is_allowed(c)) {
      filtered.push_back(static_cast<char>(c));
    }
  }

  // Strip leading and trailing dots and underscores
  const auto first = filtered.find_first_not_of("._");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = filtered.find_last_not_of("._");
  return filtered.substr(first, last - first + 1);
}

bool is_sanitized(const std::string& segment) {
  return sanitize(segment) == segment;
}

bool is_single_component(const std::string& name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      return false;
    }
  }
  return true;
}

} // namespace util
} // namespace tutor
