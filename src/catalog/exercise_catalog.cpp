#include "catalog/exercise_catalog.hpp"
#include "error/store_error.hpp"
#include <fstream>
#include <set>
#include <sstream>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace tutor {
namespace catalog {

//==============================================
// CONSTRUCTORS
//==============================================

ExerciseCatalog::ExerciseCatalog(std::vector<ExerciseIdentity> exercises, HashChain chain)
  : exercises_(std::move(exercises))
  , chain_(std::move(chain)) {
  for (std::size_t i = 0; i < exercises_.size(); ++i) {
    // Collisions are the generator's problem; the later line wins
    auto [it, inserted] = index_.emplace(exercises_[i].identity_hash, i);
    if (!inserted) {
      BOOST_LOG_TRIVIAL(warning) << "Catalog: Duplicate identity hash " << exercises_[i].identity_hash;
      it->second = i;
    }
  }
}

ExerciseCatalog ExerciseCatalog::load(const std::filesystem::path& hashes_path,
                                      const std::filesystem::path& mappings_path) {
  BOOST_LOG_TRIVIAL(info) << "Catalog: Loading exercise table from " << hashes_path.string();

  std::ifstream hashes_file(hashes_path);
  if (!hashes_file) {
    BOOST_LOG_TRIVIAL(error) << "Catalog: Failed to open exercise table: " << hashes_path.string();
    throw StoreError("Failed to open exercise table", hashes_path.string());
  }
  auto exercises = parse_hashes(hashes_file, hashes_path.string());

  HashChain chain;
  std::ifstream mappings_file(mappings_path);
  if (mappings_file) {
    chain = parse_mappings(mappings_file, mappings_path.string());
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Catalog: No hash mappings at " << mappings_path.string()
                               << ", assuming no renamed exercises";
  }

  BOOST_LOG_TRIVIAL(info) << "Catalog: Loaded " << exercises.size() << " exercises and "
                          << chain.size() << " hash mappings";
  return ExerciseCatalog(std::move(exercises), std::move(chain));
}


//==============================================
// PARSING
//==============================================

std::vector<ExerciseIdentity> ExerciseCatalog::parse_hashes(std::istream& input, const std::string& source) {
  std::vector<ExerciseIdentity> exercises;
  std::string line;
  std::size_t line_number = 0;

  while (std::getline(input, line)) {
    ++line_number;
    std::istringstream fields(line);
    std::vector<std::string> parts;
    std::string field;
    while (fields >> field) {
      parts.push_back(field);
    }

    if (parts.empty()) {
      continue;
    }

    const std::string context = source + ":" + std::to_string(line_number);
    if (parts.size() != 5) {
      BOOST_LOG_TRIVIAL(error) << "Catalog: Expected 5 fields, found " << parts.size() << " at " << context;
      throw FormatError("exercise table line must have 5 fields", context);
    }

    ExerciseIdentity identity;
    identity.identity_hash = parts[0];
    try {
      identity.due_at = util::parse_due_date(parts[1]);
    }
    catch (const FormatError& e) {
      BOOST_LOG_TRIVIAL(error) << "Catalog: " << e.what() << " at " << context;
      throw FormatError("bad due date '" + parts[1] + "'", context);
    }
    identity.package_name = parts[2];
    identity.problem_set_name = parts[3];
    identity.exercise_name = parts[4];
    exercises.push_back(std::move(identity));
  }

  if (input.bad()) {
    throw StoreError("Failed to read exercise table", source);
  }
  return exercises;
}

HashChain ExerciseCatalog::parse_mappings(std::istream& input, const std::string& source) {
  boost::property_tree::ptree tree;
  try {
    boost::property_tree::read_json(input, tree);
  }
  catch (const boost::property_tree::json_parser_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Catalog: Invalid JSON in " << source << ": " << e.what();
    throw FormatError("hash mappings are not valid JSON (" + e.message() + ")",
                      source + ":" + std::to_string(e.line()));
  }

  if (!tree.data().empty()) {
    throw FormatError("hash mappings must be a JSON object", source);
  }

  HashChain chain;
  for (const auto& [old_hash, value] : tree) {
    // Arrays parse as children with empty keys
    if (old_hash.empty()) {
      throw FormatError("hash mappings must be a JSON object", source);
    }
    if (!value.empty()) {
      throw FormatError("mapping for " + old_hash + " must be a string or null", source);
    }

    const std::string& target = value.data();
    // read_json stores JSON null as the text "null"
    if (target.empty() || target == "null") {
      chain[old_hash] = std::nullopt;
    } else {
      chain[old_hash] = target;
    }
  }
  return chain;
}


//==============================================
// RESOLUTION
//==============================================

std::optional<ExerciseIdentity> ExerciseCatalog::resolve(const std::string& hash) const {
  std::set<std::string> visited;
  std::string current = hash;

  for (std::size_t steps = 0;; ++steps) {
    auto canonical = index_.find(current);
    if (canonical != index_.end()) {
      return exercises_[canonical->second];
    }

    auto link = chain_.find(current);
    if (link == chain_.end() || !link->second) {
      BOOST_LOG_TRIVIAL(debug) << "Catalog: Hash " << hash << " does not resolve";
      return std::nullopt;
    }

    if (!visited.insert(current).second) {
      BOOST_LOG_TRIVIAL(error) << "Catalog: Hash chain starting at " << hash << " loops back to " << current;
      throw IntegrityError("hash chain contains a cycle", hash);
    }
    if (steps >= MAX_CHAIN_LENGTH) {
      BOOST_LOG_TRIVIAL(error) << "Catalog: Hash chain starting at " << hash << " exceeds "
                               << MAX_CHAIN_LENGTH << " links";
      throw IntegrityError("hash chain is too long", hash);
    }
    current = *link->second;
  }
}

std::map<std::string, ExerciseIdentity> ExerciseCatalog::resolved_table() const {
  std::map<std::string, ExerciseIdentity> table;
  for (const auto& [hash, position] : index_) {
    table.emplace(hash, exercises_[position]);
  }
  for (const auto& link : chain_) {
    if (table.count(link.first) != 0) {
      continue;
    }
    if (auto identity = resolve(link.first)) {
      table.emplace(link.first, *identity);
    }
  }
  return table;
}


//==============================================
// QUERIES
//==============================================

bool ExerciseCatalog::is_canonical(const std::string& hash) const {
  return index_.count(hash) != 0;
}

std::optional<ExerciseIdentity> ExerciseCatalog::find(const std::string& package_name,
                                                      const std::string& problem_set_name,
                                                      const std::string& exercise_name) const {
  for (const auto& identity : exercises_) {
    if (identity.package_name == package_name &&
        identity.problem_set_name == problem_set_name &&
        identity.exercise_name == exercise_name) {
      return identity;
    }
  }
  return std::nullopt;
}

} // namespace catalog
} // namespace tutor
