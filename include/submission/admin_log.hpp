#ifndef TUTOR_SUBMISSION_ADMIN_LOG_HPP
#define TUTOR_SUBMISSION_ADMIN_LOG_HPP

#include <filesystem>
#include <set>
#include <string>
#include "store/flat_file.hpp"
#include "util/keyed_mutex.hpp"

namespace tutor {
namespace submission {

// Per-user log of administrative actions, submissions/{user}/admin_log.
// The only action is "allow_late <hash>".
class AdminLog {
public:
  static constexpr const char* ALLOW_LATE_TAG = "allow_late";

  explicit AdminLog(const std::filesystem::path& submissions_dir);

  // Lets user submit the exercise late without penalty. Granting again only adds
  // another log line.
  void grant_late_allowance(const std::string& user, const std::string& identity_hash);
  bool has_late_allowance(const std::string& user, const std::string& identity_hash) const;
  // Every hash with at least one allow_late entry
  std::set<std::string> late_allowances(const std::string& user) const;

private:
  std::filesystem::path base_path_;
  util::KeyedMutex user_locks_;

  store::AppendLog log_for(const std::string& user) const;
};

} // namespace submission
} // namespace tutor

#endif // TUTOR_SUBMISSION_ADMIN_LOG_HPP
