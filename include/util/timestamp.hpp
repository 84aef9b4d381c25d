#ifndef TUTOR_UTIL_TIMESTAMP_HPP
#define TUTOR_UTIL_TIMESTAMP_HPP

#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace tutor {
namespace util {

using Timestamp = boost::posix_time::ptime;

// Current local wall-clock time with microsecond resolution
Timestamp now_local();

// Parses a due date in the catalog format HH_DD/MM/YY (local time).
// Two-digit years 69-99 map to 19xx and 00-68 to 20xx.
// Throws FormatError on anything else.
Timestamp parse_due_date(const std::string& text);
std::string format_due_date(const Timestamp& due);

// YYYY-MM-DDTHH:MM:SS[.ffffff]; fractional digits only when non-zero
std::string to_iso(const Timestamp& time);
// Accepts 'T' or ' ' between date and time and '.' or ',' before the fraction.
// Throws FormatError when the text is not a valid timestamp.
Timestamp parse_iso(const std::string& text);

} // namespace util
} // namespace tutor

#endif // TUTOR_UTIL_TIMESTAMP_HPP
