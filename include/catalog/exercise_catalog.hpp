#ifndef TUTOR_CATALOG_EXERCISE_CATALOG_HPP
#define TUTOR_CATALOG_EXERCISE_CATALOG_HPP

#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "util/timestamp.hpp"

namespace tutor {
namespace catalog {

// One currently active exercise revision
struct ExerciseIdentity {
  std::string identity_hash;
  util::Timestamp due_at;
  std::string package_name;
  std::string problem_set_name;
  std::string exercise_name;

  bool operator==(const ExerciseIdentity& other) const {
    return identity_hash == other.identity_hash && due_at == other.due_at &&
           package_name == other.package_name &&
           problem_set_name == other.problem_set_name &&
           exercise_name == other.exercise_name;
  }
  bool operator!=(const ExerciseIdentity& other) const { return !(*this == other); }
};

// Superseded hash -> replacement hash, or nullopt if the exercise was withdrawn
using HashChain = std::map<std::string, std::optional<std::string>>;

class ExerciseCatalog {
public:
  // Longest forwarding chain followed before giving up
  static constexpr std::size_t MAX_CHAIN_LENGTH = 64;

  // ---- CONSTRUCTORS ----
  ExerciseCatalog() = default;
  ExerciseCatalog(std::vector<ExerciseIdentity> exercises, HashChain chain);

  // Loads the canonical table and the rename mapping. A malformed file is fatal.
  // A missing mappings file is treated as an empty chain.
  static ExerciseCatalog load(const std::filesystem::path& hashes_path,
                              const std::filesystem::path& mappings_path);


  // ---- PARSING ----
  // Lines of "hash HH_DD/MM/YY package problem_set exercise"; blank lines ignored
  static std::vector<ExerciseIdentity> parse_hashes(std::istream& input, const std::string& source);
  // JSON object {"old_hash": "new_hash" | null}
  static HashChain parse_mappings(std::istream& input, const std::string& source);


  // ---- RESOLUTION ----
  // Follows the chain from hash to a canonical identity; nullopt if the chain
  // ends without one. Throws IntegrityError on a cycle or an over-long chain.
  std::optional<ExerciseIdentity> resolve(const std::string& hash) const;
  // Every canonical hash plus every chain hash that resolves
  std::map<std::string, ExerciseIdentity> resolved_table() const;


  // ---- QUERIES ----
  // Canonical identities in file order
  const std::vector<ExerciseIdentity>& exercises() const { return exercises_; }
  const HashChain& chain() const { return chain_; }
  bool is_canonical(const std::string& hash) const;
  std::optional<ExerciseIdentity> find(const std::string& package_name,
                                       const std::string& problem_set_name,
                                       const std::string& exercise_name) const;

private:
  // ---- PARAMETERS ----
  std::vector<ExerciseIdentity> exercises_;
  // identity_hash -> position in exercises_
  std::unordered_map<std::string, std::size_t> index_;
  HashChain chain_;
};

} // namespace catalog
} // namespace tutor

#endif // TUTOR_CATALOG_EXERCISE_CATALOG_HPP
