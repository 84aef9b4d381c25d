#include "package/package_info.hpp"
#include "package/zip_reader.hpp"
#include "error/store_error.hpp"
#include "store/flat_file.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>

namespace tutor {
namespace package {

std::string read_version(const std::filesystem::path& version_file) {
  auto content = store::read_file(version_file);
  if (!content) {
    BOOST_LOG_TRIVIAL(error) << "PackageInfo: Version file missing: " << version_file.string();
    throw StoreError("Version file missing", version_file.string());
  }
  return boost::algorithm::trim_copy(*content);
}

std::string read_archive_timestamp(const std::filesystem::path& archive_path, const std::string& entry) {
  ZipReader archive(archive_path);
  const std::string content = archive.read_entry(entry);

  const std::string first_line = content.substr(0, content.find('\n'));
  std::string timestamp = boost::algorithm::trim_copy(first_line);
  BOOST_LOG_TRIVIAL(debug) << "PackageInfo: Archive timestamp of " << archive_path.string() << ": " << timestamp;
  return timestamp;
}

} // namespace package
} // namespace tutor
