#ifndef TUTOR_PACKAGE_PACKAGE_INFO_HPP
#define TUTOR_PACKAGE_PACKAGE_INFO_HPP

#include <filesystem>
#include <string>

namespace tutor {
namespace package {

// Entry inside the exercise package whose first line is the build timestamp
inline constexpr const char* TIMESTAMP_ENTRY = "config.txt";

// Contents of the version marker file, whitespace-trimmed
std::string read_version(const std::filesystem::path& version_file);

// First line of entry in the archive, whitespace-trimmed
std::string read_archive_timestamp(const std::filesystem::path& archive_path,
                                   const std::string& entry = TIMESTAMP_ENTRY);

} // namespace package
} // namespace tutor

#endif // TUTOR_PACKAGE_PACKAGE_INFO_HPP
