#ifndef TUTOR_STATUS_STATUS_ENGINE_HPP
#define TUTOR_STATUS_STATUS_ENGINE_HPP

#include <functional>
#include <map>
#include <ostream>
#include <string>
#include "catalog/exercise_catalog.hpp"
#include "submission/admin_log.hpp"
#include "submission/submission_log.hpp"

namespace tutor {
namespace status {

enum class ExerciseStatus {
    MISSING,
    OK,
    LATE,
    LATE_OK
};

const char* status_to_string(ExerciseStatus status);
std::ostream& operator<<(std::ostream& out, ExerciseStatus status);

class StatusEngine {
public:
  // Supplies the current catalog each time statuses are computed
  using CatalogSource = std::function<catalog::ExerciseCatalog()>;

  StatusEngine(CatalogSource catalog_source,
               const submission::SubmissionLog& submissions,
               const submission::AdminLog& admin_log);

  // Status of every canonical exercise for user, keyed by canonical hash.
  // Events are applied in log order and the last one for an exercise wins.
  // Throws IntegrityError if a logged hash no longer resolves.
  std::map<std::string, ExerciseStatus> compute_statuses(const std::string& user) const;

  // Same computation against an already loaded catalog
  std::map<std::string, ExerciseStatus> compute_statuses(const catalog::ExerciseCatalog& catalog,
                                                         const std::string& user) const;

  // On time when submitted_at <= due_at
  static ExerciseStatus classify(const util::Timestamp& submitted_at, const util::Timestamp& due_at,
                                 bool late_allowed);

private:
  CatalogSource catalog_source_;
  const submission::SubmissionLog& submissions_;
  const submission::AdminLog& admin_log_;
};

} // namespace status
} // namespace tutor

#endif // TUTOR_STATUS_STATUS_ENGINE_HPP
