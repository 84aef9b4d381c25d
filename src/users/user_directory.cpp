#include "users/user_directory.hpp"
#include "error/store_error.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/log/trivial.hpp>

namespace tutor {
namespace users {

const char* enrollment_to_string(EnrollmentState state) {
  switch (state) {
    case EnrollmentState::Enrolled: return "enrolled";
    case EnrollmentState::NotEnrolled: return "not_enrolled";
    default: return "unknown";
  }
}

std::optional<EnrollmentState> parse_enrollment(const std::string& text) {
  if (text == "enrolled") return EnrollmentState::Enrolled;
  if (text == "not_enrolled") return EnrollmentState::NotEnrolled;
  return std::nullopt;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

UserDirectory::UserDirectory(const std::filesystem::path& table_path) : table_(table_path) {
  BOOST_LOG_TRIVIAL(info) << "UserDirectory: Using account table " << table_path.string();
  table_.ensure_exists();
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::optional<Account> UserDirectory::find(const std::string& id) const {
  for (const auto& account : all()) {
    if (account.id == id) {
      return account;
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "UserDirectory: No account with id " << id;
  return std::nullopt;
}

std::vector<Account> UserDirectory::search(const std::string& query,
                                           std::optional<EnrollmentState> enrollment_filter,
                                           Ordering ordering) const {
  std::vector<Account> matches;
  for (auto& account : all()) {
    const bool text_match = boost::algorithm::icontains(account.id, query) ||
                            boost::algorithm::icontains(account.display_name, query) ||
                            boost::algorithm::icontains(account.email, query);
    if (!text_match) {
      continue;
    }
    if (enrollment_filter && account.enrollment != *enrollment_filter) {
      continue;
    }
    matches.push_back(std::move(account));
  }

  if (!ordering) {
    ordering = [](const Account& a, const Account& b) { return a.id < b.id; };
  }
  std::stable_sort(matches.begin(), matches.end(), ordering);

  BOOST_LOG_TRIVIAL(debug) << "UserDirectory: Search '" << query << "' matched " << matches.size() << " accounts";
  return matches;
}

std::vector<Account> UserDirectory::all() const {
  std::vector<Account> accounts;
  std::size_t record_number = 0;
  for (const auto& record : table_.scan()) {
    ++record_number;
    if (record[0] == '#') {
      continue;
    }
    const std::string context = table_.path().string() + " (record " + std::to_string(record_number) + ")";
    accounts.push_back(parse_record(record, context));
  }
  return accounts;
}


//==============================================
// UPDATE OPERATIONS
//==============================================

bool UserDirectory::add(const Account& account) {
  validate_field(account.id, "id");
  validate_field(account.display_name, "name");
  validate_field(account.email, "email");
  // An id read back as a comment or trimmed differently could be added twice
  if (account.id.empty() || account.id.front() == '#' ||
      std::isspace(static_cast<unsigned char>(account.id.front()))) {
    throw InvalidNameError("account id must be non-empty and start with a visible character", account.id);
  }

  std::lock_guard<std::mutex> lock(mutex_);

  if (find(account.id)) {
    BOOST_LOG_TRIVIAL(debug) << "UserDirectory: Account " << account.id << " already exists";
    return false;
  }

  table_.append(account.id + "," + account.display_name + "," + account.email + "," +
                enrollment_to_string(account.enrollment));
  BOOST_LOG_TRIVIAL(info) << "UserDirectory: Added account " << account.id;
  return true;
}


//==============================================
// RECORD FORMAT
//==============================================

Account UserDirectory::parse_record(const std::string& record, const std::string& context) {
  std::vector<std::string> fields;
  std::istringstream stream(record);
  std::string field;
  while (std::getline(stream, field, ',')) {
    fields.push_back(field);
  }
  // getline drops an empty trailing field
  if (!record.empty() && record.back() == ',') {
    fields.emplace_back();
  }

  if (fields.size() != 4) {
    BOOST_LOG_TRIVIAL(error) << "UserDirectory: Expected 4 fields in " << context << ": " << record;
    throw FormatError("account line must have 4 comma-separated fields", context);
  }

  auto enrollment = parse_enrollment(fields[3]);
  if (!enrollment) {
    BOOST_LOG_TRIVIAL(error) << "UserDirectory: Unknown enrollment state '" << fields[3] << "' in " << context;
    throw FormatError("unknown enrollment state '" + fields[3] + "'", context);
  }

  return Account{fields[0], fields[1], fields[2], *enrollment};
}

void UserDirectory::validate_field(const std::string& value, const char* field) {
  if (value.find_first_of(",\r\n") != std::string::npos) {
    throw InvalidNameError(std::string("account ") + field + " must not contain commas or line breaks", value);
  }
}

} // namespace users
} // namespace tutor
