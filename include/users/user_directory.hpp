#ifndef TUTOR_USERS_USER_DIRECTORY_HPP
#define TUTOR_USERS_USER_DIRECTORY_HPP

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "store/flat_file.hpp"

namespace tutor {
namespace users {

enum class EnrollmentState {
    Enrolled,
    NotEnrolled
};

// "enrolled" / "not_enrolled", as stored in the table
const char* enrollment_to_string(EnrollmentState state);
std::optional<EnrollmentState> parse_enrollment(const std::string& text);

struct Account {
  std::string id;
  std::string display_name;
  std::string email;
  EnrollmentState enrollment = EnrollmentState::NotEnrolled;

  bool operator==(const Account& other) const {
    return id == other.id && display_name == other.display_name &&
           email == other.email && enrollment == other.enrollment;
  }
};

// Flat table of accounts, one "id,name,email,enrolled|not_enrolled" line each.
// Lines starting with '#' are comments. Accounts are never updated once added.
class UserDirectory {
public:
  // Strict weak ordering used to sort search results
  using Ordering = std::function<bool(const Account&, const Account&)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit UserDirectory(const std::filesystem::path& table_path);


  // ---- QUERY OPERATIONS ----
  std::optional<Account> find(const std::string& id) const;
  // Accounts whose id, name or email contains query (case-insensitive), optionally
  // restricted to one enrollment state. Sorted by id unless ordering is given.
  std::vector<Account> search(const std::string& query = "",
                              std::optional<EnrollmentState> enrollment_filter = std::nullopt,
                              Ordering ordering = nullptr) const;
  // Every account in file order
  std::vector<Account> all() const;


  // ---- UPDATE OPERATIONS ----
  // Appends the account unless its id already exists. Returns whether it was added.
  bool add(const Account& account);

private:
  // ---- PARAMETERS ----
  store::AppendLog table_;
  // Makes the check-then-append in add() atomic within this process
  mutable std::mutex mutex_;

  static Account parse_record(const std::string& record, const std::string& context);
  static void validate_field(const std::string& value, const char* field);
};

} // namespace users
} // namespace tutor

#endif // TUTOR_USERS_USER_DIRECTORY_HPP
