#include "util/timestamp.hpp"
#include "error/store_error.hpp"
#include <boost/log/trivial.hpp>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <vector>

namespace tutor {
namespace util {

namespace {

// Reads 1-2 decimal digits; false on anything else
bool parse_small_number(const std::string& text, int& value) {
  if (text.empty() || text.size() > 2) {
    return false;
  }
  value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  return true;
}

} // namespace

Timestamp now_local() {
  return boost::posix_time::microsec_clock::local_time();
}

//==============================================
// DUE DATES
//==============================================

Timestamp parse_due_date(const std::string& text) {
  // HH_DD/MM/YY
  const auto underscore = text.find('_');
  if (underscore == std::string::npos) {
    throw FormatError("Due date is missing the hour separator", text);
  }

  std::vector<std::string> parts{text.substr(0, underscore)};
  std::istringstream date_part(text.substr(underscore + 1));
  std::string field;
  while (std::getline(date_part, field, '/')) {
    parts.push_back(field);
  }

  int values[4] = {0, 0, 0, 0};
  if (parts.size() != 4) {
    throw FormatError("Due date must look like HH_DD/MM/YY", text);
  }
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (!parse_small_number(parts[i], values[i])) {
      throw FormatError("Due date must look like HH_DD/MM/YY", text);
    }
  }

  const int hour = values[0];
  const int day = values[1];
  const int month = values[2];
  const int year = values[3] < 69 ? 2000 + values[3] : 1900 + values[3];

  if (hour > 23) {
    throw FormatError("Due date hour out of range", text);
  }

  try {
    boost::gregorian::date date(year, month, day);
    return Timestamp(date, boost::posix_time::hours(hour));
  }
  catch (const std::out_of_range& e) {
    throw FormatError(std::string("Due date is not a calendar date (") + e.what() + ")", text);
  }
}

std::string format_due_date(const Timestamp& due) {
  const auto date = due.date();
  std::ostringstream ss;
  ss << std::setfill('0')
     << std::setw(2) << due.time_of_day().hours() << '_'
     << std::setw(2) << date.day().as_number() << '/'
     << std::setw(2) << static_cast<int>(date.month().as_number()) << '/'
     << std::setw(2) << (date.year() % 100);
  return ss.str();
}


//==============================================
// ISO-8601
//==============================================

std::string to_iso(const Timestamp& time) {
  return boost::posix_time::to_iso_extended_string(time);
}

Timestamp parse_iso(const std::string& text) {
  std::string normalized = text;
  const auto space = normalized.find(' ');
  if (space != std::string::npos) {
    normalized[space] = 'T';
  }
  if (normalized.find('T') == std::string::npos) {
    throw FormatError("Timestamp has no time of day", text);
  }

  try {
    Timestamp parsed = boost::posix_time::from_iso_extended_string(normalized);
    if (parsed.is_special()) {
      throw FormatError("Timestamp is not a point in time", text);
    }
    return parsed;
  }
  catch (const FormatError&) {
    throw;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(debug) << "Timestamp: Failed to parse '" << text << "': " << e.what();
    throw FormatError("Invalid ISO-8601 timestamp", text);
  }
}

} // namespace util
} // namespace tutor
