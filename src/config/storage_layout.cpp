#include "config/storage_layout.hpp"

namespace tutor {
namespace config {

StorageLayout StorageLayout::from_base(const std::filesystem::path& base_dir) {
  const std::filesystem::path data_dir = base_dir / "data";
  const std::filesystem::path public_dir = base_dir / "public";

  StorageLayout layout;
  layout.answers_dir = data_dir / "answers";
  layout.submissions_dir = data_dir / "submissions";
  layout.exercise_hashes_file = layout.submissions_dir / "tutorial_hashes";
  layout.hash_mappings_file = layout.submissions_dir / "tutorial_hash_mappings";
  layout.user_info_file = data_dir / "user_info";
  layout.version_file = base_dir / "mpt_version";
  layout.package_archive = public_dir / "CSSE1001Tutorials.zip";
  return layout;
}

std::ostream& operator<<(std::ostream& out, const StorageLayout& layout) {
  return out << "answers=" << layout.answers_dir.string()
             << " submissions=" << layout.submissions_dir.string()
             << " hashes=" << layout.exercise_hashes_file.string()
             << " mappings=" << layout.hash_mappings_file.string()
             << " users=" << layout.user_info_file.string()
             << " version=" << layout.version_file.string()
             << " archive=" << layout.package_archive.string();
}

} // namespace config
} // namespace tutor
