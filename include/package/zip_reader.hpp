#ifndef TUTOR_PACKAGE_ZIP_READER_HPP
#define TUTOR_PACKAGE_ZIP_READER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace tutor {
namespace package {

// Read-only access to the entries of a ZIP archive held in memory.
// Supports stored and deflated entries; ZIP64 and encryption are rejected.
class ZipReader {
public:
  // ---- CONSTRUCTORS ----
  // Reads the whole archive; throws PackageError if it is missing or malformed
  explicit ZipReader(const std::filesystem::path& archive_path);
  ZipReader(std::string archive_bytes, std::string source_name);


  // ---- QUERY OPERATIONS ----
  std::vector<std::string> entry_names() const;
  bool has_entry(const std::string& name) const;
  // Uncompressed contents of name, CRC-checked
  std::string read_entry(const std::string& name) const;

private:
  struct Entry {
    std::string name;
    uint16_t flags = 0;
    uint16_t method = 0;
    uint32_t crc32 = 0;
    uint32_t compressed_size = 0;
    uint32_t uncompressed_size = 0;
    uint32_t local_header_offset = 0;
  };

  // ---- PARAMETERS ----
  std::string data_;
  std::string source_;
  std::vector<Entry> entries_;


  // ---- ARCHIVE PARSING ----
  void parse_central_directory();
  std::size_t find_end_of_central_directory() const;
  const Entry& entry(const std::string& name) const;
  uint16_t read_u16(std::size_t offset) const;
  uint32_t read_u32(std::size_t offset) const;
  void require(std::size_t offset, std::size_t length, const char* what) const;
  // Throws PackageError once the output would exceed declared_size
  static std::string inflate(const char* data, std::size_t size, std::size_t declared_size,
                             const std::string& context);
};

} // namespace package
} // namespace tutor

#endif // TUTOR_PACKAGE_ZIP_READER_HPP
