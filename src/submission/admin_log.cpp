#include "submission/admin_log.hpp"
#include "submission/user_files.hpp"
#include "error/store_error.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>

namespace tutor {
namespace submission {

AdminLog::AdminLog(const std::filesystem::path& submissions_dir) : base_path_(submissions_dir) {
  store::ensure_directory(base_path_);
}

void AdminLog::grant_late_allowance(const std::string& user, const std::string& identity_hash) {
  if (identity_hash.empty() || identity_hash.find_first_of(" \t\r\n") != std::string::npos) {
    throw InvalidNameError("identity hash must be a single token", identity_hash);
  }

  auto lock = user_locks_.lock(user);
  log_for(user).append(std::string(ALLOW_LATE_TAG) + " " + identity_hash);
  BOOST_LOG_TRIVIAL(info) << "AdminLog: Granted late allowance to " << user << " for " << identity_hash;
}

bool AdminLog::has_late_allowance(const std::string& user, const std::string& identity_hash) const {
  return late_allowances(user).count(identity_hash) != 0;
}

std::set<std::string> AdminLog::late_allowances(const std::string& user) const {
  const store::AppendLog log = log_for(user);
  std::set<std::string> allowed;

  std::size_t record_number = 0;
  for (const auto& record : log.scan()) {
    ++record_number;
    std::istringstream fields(record);
    std::string tag, hash;
    fields >> tag;

    if (tag != ALLOW_LATE_TAG) {
      BOOST_LOG_TRIVIAL(debug) << "AdminLog: Skipping unknown action '" << tag << "' for " << user;
      continue;
    }
    if (!(fields >> hash)) {
      const std::string context = log.path().string() + " (record " + std::to_string(record_number) + ")";
      BOOST_LOG_TRIVIAL(error) << "AdminLog: allow_late without a hash in " << context;
      throw FormatError("allow_late entry has no hash", context);
    }
    allowed.insert(hash);
  }
  return allowed;
}

store::AppendLog AdminLog::log_for(const std::string& user) const {
  return store::AppendLog(user_directory(base_path_, user) / ADMIN_LOG_NAME);
}

} // namespace submission
} // namespace tutor
