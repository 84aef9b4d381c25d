#include "store/answer_store.hpp"
#include "store/flat_file.hpp"
#include "error/store_error.hpp"
#include "util/digest.hpp"
#include "util/sanitizer.hpp"
#include <boost/log/trivial.hpp>
#include <sys/stat.h>

namespace tutor {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

AnswerStore::AnswerStore(const std::filesystem::path& answers_dir) : base_path_(answers_dir) {
  BOOST_LOG_TRIVIAL(info) << "AnswerStore: Initializing with base path: " << base_path_.string();
  ensure_directory(base_path_);
  BOOST_LOG_TRIVIAL(debug) << "AnswerStore: Answers directory created/verified at: " << base_path_.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::optional<std::string> AnswerStore::read(const DraftKey& key) const {
  BOOST_LOG_TRIVIAL(info) << "AnswerStore: Reading draft for " << key.user << " / " << key.exercise;

  // The student's directory tree mirrors their local package as soon as they touch it
  ensure_problem_set(key);

  auto text = read_file(draft_path(key));
  if (!text) {
    BOOST_LOG_TRIVIAL(debug) << "AnswerStore: No draft stored for " << key.user << " / " << key.exercise;
    return std::nullopt;
  }

  BOOST_LOG_TRIVIAL(info) << "AnswerStore: Read " << text->size() << " bytes";
  return text;
}

void AnswerStore::write(const DraftKey& key, const std::string& text) const {
  BOOST_LOG_TRIVIAL(info) << "AnswerStore: Writing draft for " << key.user << " / " << key.exercise;

  ensure_problem_set(key);
  const std::filesystem::path path = draft_path(key);
  write_file_atomically(path, text);

  BOOST_LOG_TRIVIAL(info) << "AnswerStore: Stored " << text.size() << " bytes at " << path.string();
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::optional<std::string> AnswerStore::hash(const DraftKey& key) const {
  auto text = read(key);
  if (!text) {
    return std::nullopt;
  }

  std::string digest = util::sha512_base32(*text);
  BOOST_LOG_TRIVIAL(debug) << "AnswerStore: Draft hash for " << key.user << " / " << key.exercise << ": " << digest;
  return digest;
}

std::optional<std::time_t> AnswerStore::modified_at(const DraftKey& key) const {
  ensure_problem_set(key);
  const std::filesystem::path path = draft_path(key);

  struct stat info {};
  if (::stat(path.c_str(), &info) != 0) {
    BOOST_LOG_TRIVIAL(debug) << "AnswerStore: No draft to stat at " << path.string();
    return std::nullopt;
  }
  return info.st_mtime;
}


//==============================================
// DIRECTORY MANAGEMENT
//==============================================

std::filesystem::path AnswerStore::ensure_problem_set(const DraftKey& key) const {
  std::filesystem::path dir = problem_set_dir(key);
  ensure_directory(dir);
  return dir;
}

std::filesystem::path AnswerStore::draft_path(const DraftKey& key) const {
  return problem_set_dir(key) / safe_component(key.exercise, "exercise");
}


//==============================================
// PATH SUPPORT
//==============================================

std::filesystem::path AnswerStore::problem_set_dir(const DraftKey& key) const {
  // Usernames come from the authentication layer and are used verbatim, but they
  // still have to be a single path component
  if (!util::is_single_component(key.user)) {
    throw InvalidNameError("username is not a single path component", key.user);
  }

  return base_path_ / key.user
      / safe_component(key.package, "package")
      / safe_component(key.problem_set, "problem set");
}

std::string AnswerStore::safe_component(const std::string& name, const char* what) {
  std::string safe = util::sanitize(name);
  if (safe.empty()) {
    BOOST_LOG_TRIVIAL(error) << "AnswerStore: " << what << " name '" << name << "' has no safe characters";
    throw InvalidNameError(std::string(what) + " name has no safe characters", name);
  }
  return safe;
}

} // namespace store
} // namespace tutor
