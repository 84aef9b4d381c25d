#include "storage/storage.hpp"
#include "package/package_info.hpp"
#include <boost/log/trivial.hpp>

namespace tutor {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Storage::Storage(const config::StorageLayout& layout, submission::SubmissionLog::Clock clock)
  : layout_(layout) {
  BOOST_LOG_TRIVIAL(info) << "Storage: Initializing with layout " << layout_;

  try {
    answers_ = std::make_unique<store::AnswerStore>(layout_.answers_dir);
    submissions_ = std::make_unique<submission::SubmissionLog>(layout_.submissions_dir, std::move(clock));
    admin_log_ = std::make_unique<submission::AdminLog>(layout_.submissions_dir);
    users_ = std::make_unique<users::UserDirectory>(layout_.user_info_file);
    status_engine_ = std::make_unique<status::StatusEngine>(
        [this]() { return load_catalog(); }, *submissions_, *admin_log_);
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Storage: Failed to initialize: " << e.what();
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Storage: Initialization complete";
}


//==============================================
// CATALOG AND STATUS
//==============================================

catalog::ExerciseCatalog Storage::load_catalog() const {
  return catalog::ExerciseCatalog::load(layout_.exercise_hashes_file, layout_.hash_mappings_file);
}

std::map<std::string, status::ExerciseStatus> Storage::statuses(const std::string& user) const {
  return status_engine_->compute_statuses(user);
}


//==============================================
// PACKAGE INFO
//==============================================

std::string Storage::version() const {
  return package::read_version(layout_.version_file);
}

std::string Storage::tutorials_timestamp() const {
  return package::read_archive_timestamp(layout_.package_archive);
}

} // namespace tutor
