#ifndef TUTOR_UTIL_SANITIZER_HPP
#define TUTOR_UTIL_SANITIZER_HPP

#include <string>

namespace tutor {
namespace util {

// Turns an untrusted name into one safe filesystem path component.
// Non-ASCII bytes are dropped, separators and whitespace runs become a single '_',
// anything outside [A-Za-z0-9_.-] is removed and leading/trailing '.' and '_' are
// stripped. The result may be empty. sanitize(sanitize(x)) == sanitize(x).
std::string sanitize(const std::string& segment);

// True when sanitize(segment) would return segment unchanged
bool is_sanitized(const std::string& segment);

// True when name can be joined onto a directory without leaving it: non-empty,
// not "." or "..", and free of separators and NUL bytes. Used for trusted names
// (usernames) that are not sanitized.
bool is_single_component(const std::string& name);

} // namespace util
} // namespace tutor

#endif // TUTOR_UTIL_SANITIZER_HPP
