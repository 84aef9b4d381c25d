#include "submission/user_files.hpp"
#include "error/store_error.hpp"
#include "util/sanitizer.hpp"

namespace tutor {
namespace submission {

std::filesystem::path user_directory(const std::filesystem::path& submissions_dir,
                                     const std::string& user) {
  // Usernames are authenticated upstream and used verbatim
  if (!util::is_single_component(user)) {
    throw InvalidNameError("username is not a single path component", user);
  }
  return submissions_dir / user;
}

} // namespace submission
} // namespace tutor
