#pragma once

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

namespace tutor {
namespace store {

// Identifies one draft: the trusted username plus the untrusted names of the
// package, problem set and exercise as the client reports them
struct DraftKey {
  std::string user;
  std::string package;
  std::string problem_set;
  std::string exercise;
};

class AnswerStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit AnswerStore(const std::filesystem::path& answers_dir);


  // ---- CORE STORAGE OPERATIONS ----
  // Returns the stored draft; creates the problem set directory if missing
  std::optional<std::string> read(const DraftKey& key) const;
  // Stores text as the draft, replacing any previous content
  void write(const DraftKey& key, const std::string& text) const;


  // ---- QUERY OPERATIONS ----
  // base32(SHA-512) of the stored draft
  std::optional<std::string> hash(const DraftKey& key) const;
  // Last write time of the stored draft as Unix seconds
  std::optional<std::time_t> modified_at(const DraftKey& key) const;


  // ---- DIRECTORY MANAGEMENT ----
  // Creates answers/{user}/{package}/{set} if needed and returns it
  std::filesystem::path ensure_problem_set(const DraftKey& key) const;
  // Where the draft for key lives (sanitized); does not touch the filesystem
  std::filesystem::path draft_path(const DraftKey& key) const;

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root of all answer files
  std::filesystem::path base_path_;


  // ---- PATH SUPPORT ----
  std::filesystem::path problem_set_dir(const DraftKey& key) const;
  // Sanitizes one untrusted name, throws InvalidNameError if nothing is left
  static std::string safe_component(const std::string& name, const char* what);
};

} // namespace store
} // namespace tutor
