#include "status/status_engine.hpp"
#include "error/store_error.hpp"
#include <boost/log/trivial.hpp>

namespace tutor {
namespace status {

const char* status_to_string(ExerciseStatus status) {
  switch (status) {
    case ExerciseStatus::MISSING: return "MISSING";
    case ExerciseStatus::OK: return "OK";
    case ExerciseStatus::LATE: return "LATE";
    case ExerciseStatus::LATE_OK: return "LATE_OK";
    default: return "UNKNOWN";
  }
}

std::ostream& operator<<(std::ostream& out, ExerciseStatus status) {
  return out << status_to_string(status);
}

StatusEngine::StatusEngine(CatalogSource catalog_source,
                           const submission::SubmissionLog& submissions,
                           const submission::AdminLog& admin_log)
  : catalog_source_(std::move(catalog_source))
  , submissions_(submissions)
  , admin_log_(admin_log) {}

std::map<std::string, ExerciseStatus> StatusEngine::compute_statuses(const std::string& user) const {
  return compute_statuses(catalog_source_(), user);
}

std::map<std::string, ExerciseStatus> StatusEngine::compute_statuses(const catalog::ExerciseCatalog& catalog,
                                                                     const std::string& user) const {
  BOOST_LOG_TRIVIAL(info) << "StatusEngine: Computing statuses for " << user;

  std::map<std::string, ExerciseStatus> statuses;
  for (const auto& identity : catalog.exercises()) {
    statuses[identity.identity_hash] = ExerciseStatus::MISSING;
  }

  const auto allowances = admin_log_.late_allowances(user);
  const auto events = submissions_.read_submissions(user);

  for (const auto& event : events) {
    auto identity = catalog.resolve(event.identity_hash);
    if (!identity) {
      // The log references an exercise the catalog no longer knows under any name
      BOOST_LOG_TRIVIAL(error) << "StatusEngine: Submission by " << user << " references unknown hash "
                               << event.identity_hash;
      throw IntegrityError("submission references an unknown exercise", event.identity_hash);
    }

    const bool late_allowed = allowances.count(event.identity_hash) != 0 ||
                              allowances.count(identity->identity_hash) != 0;
    statuses[identity->identity_hash] = classify(event.submitted_at, identity->due_at, late_allowed);
  }

  BOOST_LOG_TRIVIAL(debug) << "StatusEngine: Applied " << events.size() << " submissions over "
                           << statuses.size() << " exercises for " << user;
  return statuses;
}

ExerciseStatus StatusEngine::classify(const util::Timestamp& submitted_at, const util::Timestamp& due_at,
                                      bool late_allowed) {
  if (submitted_at <= due_at) {
    return ExerciseStatus::OK;
  }
  return late_allowed ? ExerciseStatus::LATE_OK : ExerciseStatus::LATE;
}

} // namespace status
} // namespace tutor
