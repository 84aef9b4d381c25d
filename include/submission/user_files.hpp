#ifndef TUTOR_SUBMISSION_USER_FILES_HPP
#define TUTOR_SUBMISSION_USER_FILES_HPP

#include <filesystem>
#include <string>

namespace tutor {
namespace submission {

// File names inside submissions/{user}/
inline constexpr const char* SUBMISSION_LOG_NAME = "submission_log";
inline constexpr const char* ADMIN_LOG_NAME = "admin_log";

// submissions_dir/{user}; throws InvalidNameError if user is not a single component
std::filesystem::path user_directory(const std::filesystem::path& submissions_dir,
                                     const std::string& user);

} // namespace submission
} // namespace tutor

#endif // TUTOR_SUBMISSION_USER_FILES_HPP
