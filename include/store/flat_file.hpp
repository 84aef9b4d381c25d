#ifndef TUTOR_STORE_FLAT_FILE_HPP
#define TUTOR_STORE_FLAT_FILE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tutor {
namespace store {

// ---- FILE HELPERS ----
// Creates the directory (and parents) if missing; no-op otherwise
void ensure_directory(const std::filesystem::path& path);
// Whole file contents, or nullopt if the file does not exist
std::optional<std::string> read_file(const std::filesystem::path& path);
// Writes to a temporary sibling and renames it over path, so readers see either
// the old or the new content, never a partial write
void write_file_atomically(const std::filesystem::path& path, const std::string& content);


// Line-oriented append-only log stored in one file.
// Records are single lines; scan() returns them trimmed, skipping blank lines.
class AppendLog {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit AppendLog(std::filesystem::path path);


  // ---- CORE LOG OPERATIONS ----
  // Creates the parent directory and an empty file if they do not exist
  void ensure_exists() const;
  // Appends one record followed by a newline
  void append(const std::string& record) const;
  // Returns all non-blank records in file order
  std::vector<std::string> scan() const;


  // ---- GETTERS ----
  const std::filesystem::path& path() const { return path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path path_;
};

} // namespace store
} // namespace tutor

#endif // TUTOR_STORE_FLAT_FILE_HPP
