#ifndef TUTOR_CONFIG_STORAGE_LAYOUT_HPP
#define TUTOR_CONFIG_STORAGE_LAYOUT_HPP

#include <filesystem>
#include <ostream>

namespace tutor {
namespace config {

// Where every persisted file lives. from_base() gives the standard layout:
//   base/mpt_version
//   base/public/CSSE1001Tutorials.zip
//   base/data/answers/
//   base/data/submissions/{tutorial_hashes,tutorial_hash_mappings}
//   base/data/user_info
struct StorageLayout {
  std::filesystem::path answers_dir;
  std::filesystem::path submissions_dir;
  std::filesystem::path exercise_hashes_file;
  std::filesystem::path hash_mappings_file;
  std::filesystem::path user_info_file;
  std::filesystem::path version_file;
  std::filesystem::path package_archive;

  static StorageLayout from_base(const std::filesystem::path& base_dir);
};

std::ostream& operator<<(std::ostream& out, const StorageLayout& layout);

} // namespace config
} // namespace tutor

#endif // TUTOR_CONFIG_STORAGE_LAYOUT_HPP
