#ifndef TUTOR_SUBMISSION_SUBMISSION_LOG_HPP
#define TUTOR_SUBMISSION_SUBMISSION_LOG_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "store/flat_file.hpp"
#include "util/keyed_mutex.hpp"
#include "util/timestamp.hpp"

namespace tutor {
namespace submission {

struct SubmissionEvent {
  std::string identity_hash;
  util::Timestamp submitted_at;
};

// Per-user append-only record of formal submissions plus the code snapshots:
//   submissions/{user}/submission_log   "hash iso8601" lines
//   submissions/{user}/{stripped hash}  code as submitted
class SubmissionLog {
public:
  using Clock = std::function<util::Timestamp()>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit SubmissionLog(const std::filesystem::path& submissions_dir, Clock clock = util::now_local);


  // ---- SUBMISSION OPERATIONS ----
  // Records a submission of code for the exercise identified by identity_hash.
  // The hash is validated first: if its stripped form is not a safe file name an
  // IntegrityError is thrown and nothing is written. Otherwise the snapshot is
  // written (replacing any earlier one) and then the log line is appended.
  SubmissionEvent append_submission(const std::string& user, const std::string& identity_hash,
                                    const std::string& code);
  // All events in file order
  std::vector<SubmissionEvent> read_submissions(const std::string& user) const;
  // Code stored by the latest submission for identity_hash
  std::optional<std::string> read_snapshot(const std::string& user, const std::string& identity_hash) const;


  // ---- PATHS ----
  std::filesystem::path snapshot_path(const std::string& user, const std::string& identity_hash) const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  Clock clock_;
  // Serializes appends per user within this process
  util::KeyedMutex user_locks_;

  store::AppendLog log_for(const std::string& user) const;
  // Stripped hash usable as a file name, or IntegrityError
  static std::string snapshot_name(const std::string& identity_hash);
};

} // namespace submission
} // namespace tutor

#endif // TUTOR_SUBMISSION_SUBMISSION_LOG_HPP
