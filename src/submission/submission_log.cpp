#include "submission/submission_log.hpp"
#include "submission/user_files.hpp"
#include "error/store_error.hpp"
#include "util/digest.hpp"
#include "util/sanitizer.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>

namespace tutor {
namespace submission {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SubmissionLog::SubmissionLog(const std::filesystem::path& submissions_dir, Clock clock)
  : base_path_(submissions_dir)
  , clock_(std::move(clock)) {
  BOOST_LOG_TRIVIAL(info) << "SubmissionLog: Initializing with base path: " << base_path_.string();
  store::ensure_directory(base_path_);
}


//==============================================
// SUBMISSION OPERATIONS
//==============================================

SubmissionEvent SubmissionLog::append_submission(const std::string& user, const std::string& identity_hash,
                                                 const std::string& code) {
  BOOST_LOG_TRIVIAL(info) << "SubmissionLog: Submission from " << user << " for " << identity_hash;

  // Validate before touching the filesystem so a bad hash leaves no orphan log line
  const std::filesystem::path path = snapshot_path(user, identity_hash);

  auto lock = user_locks_.lock(user);

  SubmissionEvent event{identity_hash, clock_()};
  store::write_file_atomically(path, code);
  log_for(user).append(identity_hash + " " + util::to_iso(event.submitted_at));

  BOOST_LOG_TRIVIAL(info) << "SubmissionLog: Recorded " << code.size() << " bytes at "
                          << util::to_iso(event.submitted_at);
  return event;
}

std::vector<SubmissionEvent> SubmissionLog::read_submissions(const std::string& user) const {
  const store::AppendLog log = log_for(user);
  std::vector<SubmissionEvent> events;

  std::size_t record_number = 0;
  for (const auto& record : log.scan()) {
    ++record_number;
    const std::string context = log.path().string() + " (record " + std::to_string(record_number) + ")";

    std::istringstream fields(record);
    std::string hash, submitted_at, extra;
    if (!(fields >> hash >> submitted_at) || (fields >> extra)) {
      BOOST_LOG_TRIVIAL(error) << "SubmissionLog: Malformed record in " << context << ": " << record;
      throw FormatError("submission log line must be 'hash timestamp'", context);
    }

    try {
      events.push_back(SubmissionEvent{hash, util::parse_iso(submitted_at)});
    }
    catch (const FormatError& e) {
      BOOST_LOG_TRIVIAL(error) << "SubmissionLog: " << e.what() << " in " << context;
      throw FormatError("bad submission timestamp '" + submitted_at + "'", context);
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "SubmissionLog: Read " << events.size() << " submissions for " << user;
  return events;
}

std::optional<std::string> SubmissionLog::read_snapshot(const std::string& user,
                                                        const std::string& identity_hash) const {
  return store::read_file(snapshot_path(user, identity_hash));
}


//==============================================
// PATHS
//==============================================

std::filesystem::path SubmissionLog::snapshot_path(const std::string& user,
                                                   const std::string& identity_hash) const {
  return user_directory(base_path_, user) / snapshot_name(identity_hash);
}

store::AppendLog SubmissionLog::log_for(const std::string& user) const {
  return store::AppendLog(user_directory(base_path_, user) / SUBMISSION_LOG_NAME);
}

std::string SubmissionLog::snapshot_name(const std::string& identity_hash) {
  // A base32 hash only ever needs its padding removed; anything else means the
  // hash did not come from the catalog
  const std::string stripped = util::strip_padding(identity_hash);
  if (stripped.empty() || !util::is_sanitized(stripped) ||
      stripped == SUBMISSION_LOG_NAME || stripped == ADMIN_LOG_NAME) {
    BOOST_LOG_TRIVIAL(error) << "SubmissionLog: Refusing unsafe identity hash '" << identity_hash << "'";
    throw IntegrityError("identity hash is not a safe file name", identity_hash);
  }
  return stripped;
}

} // namespace submission
} // namespace tutor
