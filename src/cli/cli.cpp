#include "cli/cli.hpp"
#include "error/store_error.hpp"
#include "store/flat_file.hpp"
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace tutor {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(Storage& storage, std::istream& input, std::ostream& output)
  : running_(false)
  , storage_(storage)
  , in_(input)
  , out_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting command loop";
  out_ << "tutor_store> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "tutor_store> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Command loop ended";
}

bool CLI::execute(const std::string& line) {
  const auto args = tokenize(line);
  if (args.empty()) {
    return true;
  }
  if (args[0] == "quit") {
    return false;
  }

  try {
    process_command(args);
  } catch (const StoreError& e) {
    std::string detail = std::string(error_kind_to_string(e.kind())) + ": " + e.what();
    if (!e.context().empty()) {
      detail += " [" + e.context() + "]";
    }
    log_and_display_error("Error running " + args[0], detail);
  } catch (const std::exception& e) {
    log_and_display_error("Error running " + args[0], e.what());
  }
  return true;
}

std::vector<std::string> CLI::tokenize(const std::string& line) {
  std::vector<std::string> tokens;
  std::istringstream iss(line);
  std::string token;
  while (iss >> std::quoted(token)) {
    tokens.push_back(token);
  }
  return tokens;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::vector<std::string>& args) {
  const std::string& command = args[0];
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with " << args.size() - 1 << " arguments";

  if (command == "help") {
    handle_help_command();
  }
  else if (command == "read") {
    handle_read_command(args);
  }
  else if (command == "write") {
    handle_write_command(args);
  }
  else if (command == "hash") {
    handle_hash_command(args);
  }
  else if (command == "mtime") {
    handle_mtime_command(args);
  }
  else if (command == "submit") {
    handle_submit_command(args);
  }
  else if (command == "submissions") {
    handle_submissions_command(args);
  }
  else if (command == "status") {
    handle_status_command(args);
  }
  else if (command == "allow-late") {
    handle_allow_late_command(args);
  }
  else if (command == "late") {
    handle_late_command(args);
  }
  else if (command == "user") {
    handle_user_command(args);
  }
  else if (command == "users") {
    handle_users_command(args);
  }
  else if (command == "add-user") {
    handle_add_user_command(args);
  }
  else if (command == "version" && args.size() == 1) {
    out_ << storage_.version() << std::endl;
  }
  else if (command == "timestamp" && args.size() == 1) {
    out_ << storage_.tutorials_timestamp() << std::endl;
  }
  else {
    out_ << "Unknown command or invalid arguments (try 'help')" << std::endl;
  }
}

void CLI::handle_read_command(const std::vector<std::string>& args) {
  if (!expect_args(args, 5, "read <user> <package> <set> <exercise>")) return;

  auto text = storage_.answers().read(draft_key(args));
  if (!text) {
    out_ << "No answer stored" << std::endl;
    return;
  }
  out_ << *text;
  if (!text->empty() && text->back() != '\n') {
    out_ << '\n';
  }
  out_ << std::flush;
}

void CLI::handle_write_command(const std::vector<std::string>& args) {
  if (!expect_args(args, 6, "write <user> <package> <set> <exercise> <local_file>")) return;

  auto text = store::read_file(args[5]);
  if (!text) {
    out_ << "Error opening file: " << args[5] << std::endl;
    return;
  }
  storage_.answers().write(draft_key(args), *text);
  out_ << "Answer stored (" << text->size() << " bytes)" << std::endl;
}

void CLI::handle_hash_command(const std::vector<std::string>& args) {
  if (!expect_args(args, 5, "hash <user> <package> <set> <exercise>")) return;

  auto hash = storage_.answers().hash(draft_key(args));
  out_ << (hash ? *hash : std::string("No answer stored")) << std::endl;
}

void CLI::handle_mtime_command(const std::vector<std::string>& args) {
  if (!expect_args(args, 5, "mtime <user> <package> <set> <exercise>")) return;

  auto modified = storage_.answers().modified_at(draft_key(args));
  if (!modified) {
    out_ << "No answer stored" << std::endl;
    return;
  }
  out_ << *modified << std::endl;
}

void CLI::handle_submit_command(const std::vector<std::string>& args) {
  if (!expect_args(args, 4, "submit <user> <hash> <local_file>")) return;

  auto code = store::read_file(args[3]);
  if (!code) {
    out_ << "Error opening file: " << args[3] << std::endl;
    return;
  }
  auto event = storage_.submissions().append_submission(args[1], args[2], *code);
  out_ << "Submitted " << event.identity_hash << " at " << util::to_iso(event.submitted_at) << std::endl;
}

void CLI::handle_submissions_command(const std::vector<std::string>& args) {
  if (!expect_args(args, 2, "submissions <user>")) return;

  const auto events = storage_.submissions().read_submissions(args[1]);
  for (const auto& event : events) {
    out_ << event.identity_hash << ' ' << util::to_iso(event.submitted_at) << '\n';
  }
  out_ << events.size() << " submission(s)" << std::endl;
}

void CLI::handle_status_command(const std::vector<std::string>& args) {
  if (!expect_args(args, 2, "status <user>")) return;

  const auto catalog = storage_.load_catalog();
  const auto statuses = storage_.status_engine().compute_statuses(catalog, args[1]);
  for (const auto& identity : catalog.exercises()) {
    out_ << std::left << std::setw(8) << statuses.at(identity.identity_hash) << ' '
         << identity.package_name << '/' << identity.problem_set_name << '/' << identity.exercise_name
         << " (due " << util::to_iso(identity.due_at) << ")\n";
  }
  out_ << std::flush;
}

void CLI::handle_allow_late_command(const std::vector<std::string>& args) {
  if (!expect_args(args, 3, "allow-late <user> <hash>")) return;

  storage_.admin_log().grant_late_allowance(args[1], args[2]);
  out_ << "Late submission allowed for " << args[1] << std::endl;
}

void CLI::handle_late_command(const std::vector<std::string>& args) {
  if (!expect_args(args, 2, "late <user>")) return;

  for (const auto& hash : storage_.admin_log().late_allowances(args[1])) {
    out_ << hash << '\n';
  }
  out_ << std::flush;
}

void CLI::handle_user_command(const std::vector<std::string>& args) {
  if (!expect_args(args, 2, "user <id>")) return;

  auto account = storage_.user_directory().find(args[1]);
  if (!account) {
    out_ << "Unknown user: " << args[1] << std::endl;
    return;
  }
  out_ << account->id << ", " << account->display_name << ", " << account->email << ", "
       << users::enrollment_to_string(account->enrollment) << std::endl;
}

void CLI::handle_users_command(const std::vector<std::string>& args) {
  if (args.size() > 3) {
    out_ << "Usage: users [query] [enrolled|not_enrolled]" << std::endl;
    return;
  }

  const std::string query = args.size() > 1 ? args[1] : "";
  std::optional<users::EnrollmentState> filter;
  if (args.size() > 2) {
    filter = users::parse_enrollment(args[2]);
    if (!filter) {
      out_ << "Unknown enrollment state: " << args[2] << std::endl;
      return;
    }
  }

  const auto accounts = storage_.user_directory().search(query, filter);
  for (const auto& account : accounts) {
    out_ << account.id << ", " << account.display_name << ", " << account.email << ", "
         << users::enrollment_to_string(account.enrollment) << '\n';
  }
  out_ << accounts.size() << " user(s)" << std::endl;
}

void CLI::handle_add_user_command(const std::vector<std::string>& args) {
  if (!expect_args(args, 5, "add-user <id> <name> <email> <enrolled|not_enrolled>")) return;

  auto enrollment = users::parse_enrollment(args[4]);
  if (!enrollment) {
    out_ << "Unknown enrollment state: " << args[4] << std::endl;
    return;
  }

  const bool added = storage_.user_directory().add(users::Account{args[1], args[2], args[3], *enrollment});
  out_ << (added ? "User added" : "User already exists") << std::endl;
}

void CLI::handle_help_command() {
  out_ << "Available commands:\n"
       << "  help                                          Display this help message\n"
       << "  read <user> <pkg> <set> <exercise>            Print the stored answer\n"
       << "  write <user> <pkg> <set> <exercise> <file>    Store local <file> as the answer\n"
       << "  hash <user> <pkg> <set> <exercise>            Print the answer hash\n"
       << "  mtime <user> <pkg> <set> <exercise>           Print the answer modification time\n"
       << "  submit <user> <hash> <file>                   Submit local <file> for exercise <hash>\n"
       << "  submissions <user>                            List submissions\n"
       << "  status <user>                                 Show completion status per exercise\n"
       << "  allow-late <user> <hash>                      Waive the late penalty\n"
       << "  late <user>                                   List late allowances\n"
       << "  user <id>                                     Show one account\n"
       << "  users [query] [enrolled|not_enrolled]         Search accounts\n"
       << "  add-user <id> <name> <email> <state>          Add an account\n"
       << "  version                                       Print the version marker\n"
       << "  timestamp                                     Print the exercise package timestamp\n"
       << "  quit                                          Exit the shell\n"
       << "Quote arguments that contain spaces, e.g. \"Using Functions\"\n" << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

bool CLI::expect_args(const std::vector<std::string>& args, std::size_t count, const char* usage) {
  if (args.size() != count) {
    out_ << "Usage: " << usage << std::endl;
    return false;
  }
  return true;
}

store::DraftKey CLI::draft_key(const std::vector<std::string>& args) {
  return store::DraftKey{args[1], args[2], args[3], args[4]};
}

} // namespace cli
} // namespace tutor
