#ifndef TUTOR_STORAGE_STORAGE_HPP
#define TUTOR_STORAGE_STORAGE_HPP

#include <map>
#include <memory>
#include <string>
#include "catalog/exercise_catalog.hpp"
#include "config/storage_layout.hpp"
#include "status/status_engine.hpp"
#include "store/answer_store.hpp"
#include "submission/admin_log.hpp"
#include "submission/submission_log.hpp"
#include "users/user_directory.hpp"

namespace tutor {

// Owns every storage component for one layout. This is the object the request
// layer holds; it passes an already-authenticated username into each call.
class Storage {
public:
  // Delete copy constructor and assignment operator
  Storage(const Storage&) = delete;
  Storage& operator=(const Storage&) = delete;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Storage(const config::StorageLayout& layout,
                   submission::SubmissionLog::Clock clock = util::now_local);


  // ---- COMPONENTS ----
  store::AnswerStore& answers() { return *answers_; }
  submission::SubmissionLog& submissions() { return *submissions_; }
  submission::AdminLog& admin_log() { return *admin_log_; }
  users::UserDirectory& user_directory() { return *users_; }
  const status::StatusEngine& status_engine() const { return *status_engine_; }
  const config::StorageLayout& layout() const { return layout_; }


  // ---- CATALOG AND STATUS ----
  // Reads the exercise table and hash mappings from disk
  catalog::ExerciseCatalog load_catalog() const;
  std::map<std::string, status::ExerciseStatus> statuses(const std::string& user) const;


  // ---- PACKAGE INFO ----
  std::string version() const;
  std::string tutorials_timestamp() const;

private:
  // ---- PARAMETERS ----
  config::StorageLayout layout_;
  std::unique_ptr<store::AnswerStore> answers_;
  std::unique_ptr<submission::SubmissionLog> submissions_;
  std::unique_ptr<submission::AdminLog> admin_log_;
  std::unique_ptr<users::UserDirectory> users_;
  std::unique_ptr<status::StatusEngine> status_engine_;
};

} // namespace tutor

#endif // TUTOR_STORAGE_STORAGE_HPP
