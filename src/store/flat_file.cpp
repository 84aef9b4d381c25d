#include "store/flat_file.hpp"
#include "error/store_error.hpp"
#include <atomic>
#include <fstream>
#include <functional>
#include <sstream>
#include <thread>
#include <boost/log/trivial.hpp>

namespace tutor {
namespace store {

namespace {

// Trims surrounding whitespace, including the '\r' of CRLF files
std::string trim(const std::string& line) {
  const auto first = line.find_first_not_of(" \t\r\n\v\f");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = line.find_last_not_of(" \t\r\n\v\f");
  return line.substr(first, last - first + 1);
}

std::filesystem::path temporary_sibling(const std::filesystem::path& path) {
  static std::atomic<unsigned long> counter{0};
  const auto thread_tag = std::hash<std::thread::id>{}(std::this_thread::get_id());

  std::ostringstream name;
  name << '.' << path.filename().string() << ".tmp." << thread_tag << '.' << counter++;
  return path.parent_path() / name.str();
}

} // namespace


//==============================================
// FILE HELPERS
//==============================================

void ensure_directory(const std::filesystem::path& path) {
  if (path.empty() || std::filesystem::is_directory(path)) {
    return;
  }

  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  // Another writer may have created it between the check and the call
  if (ec && !std::filesystem::is_directory(path)) {
    BOOST_LOG_TRIVIAL(error) << "FlatFile: Failed to create directory " << path.string() << ": " << ec.message();
    throw StoreError("Failed to create directory: " + ec.message(), path.string());
  }
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    BOOST_LOG_TRIVIAL(debug) << "FlatFile: No file at " << path.string();
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "FlatFile: Failed to open file: " << path.string();
    throw StoreError("Failed to open file", path.string());
  }

  std::ostringstream content;
  content << file.rdbuf();
  if (file.bad()) {
    throw StoreError("Failed to read file", path.string());
  }
  return content.str();
}

void write_file_atomically(const std::filesystem::path& path, const std::string& content) {
  ensure_directory(path.parent_path());
  const std::filesystem::path temp_path = temporary_sibling(path);
  BOOST_LOG_TRIVIAL(debug) << "FlatFile: Writing " << content.size() << " bytes via " << temp_path.string();

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "FlatFile: Failed to create file: " << temp_path.string();
      throw StoreError("Failed to create file", temp_path.string());
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
      file.close();
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      throw StoreError("Failed to write file", path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    BOOST_LOG_TRIVIAL(error) << "FlatFile: Failed to replace " << path.string() << ": " << ec.message();
    throw StoreError("Failed to replace file: " + ec.message(), path.string());
  }
}


//==============================================
// APPEND LOG
//==============================================

AppendLog::AppendLog(std::filesystem::path path) : path_(std::move(path)) {}

void AppendLog::ensure_exists() const {
  if (std::filesystem::exists(path_)) {
    return;
  }

  ensure_directory(path_.parent_path());
  // Append mode never truncates a file created concurrently by someone else
  std::ofstream file(path_, std::ios::app);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "AppendLog: Failed to create log: " << path_.string();
    throw StoreError("Failed to create log", path_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "AppendLog: Created empty log at " << path_.string();
}

void AppendLog::append(const std::string& record) const {
  if (record.find_first_of("\r\n") != std::string::npos) {
    BOOST_LOG_TRIVIAL(error) << "AppendLog: Rejected multi-line record for " << path_.string();
    throw FormatError("log record must be a single line", path_.string());
  }

  ensure_exists();

  std::ofstream file(path_, std::ios::app | std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "AppendLog: Failed to open log for append: " << path_.string();
    throw StoreError("Failed to open log for append", path_.string());
  }

  const std::string line = record + '\n';
  file.write(line.data(), static_cast<std::streamsize>(line.size()));
  file.flush();
  if (!file) {
    throw StoreError("Failed to append to log", path_.string());
  }
  BOOST_LOG_TRIVIAL(trace) << "AppendLog: Appended to " << path_.string() << ": " << record;
}

std::vector<std::string> AppendLog::scan() const {
  ensure_exists();

  std::ifstream file(path_, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "AppendLog: Failed to open log: " << path_.string();
    throw StoreError("Failed to open log", path_.string());
  }

  std::vector<std::string> records;
  std::string line;
  while (std::getline(file, line)) {
    std::string record = trim(line);
    if (!record.empty()) {
      records.push_back(std::move(record));
    }
  }
  if (file.bad()) {
    throw StoreError("Failed to read log", path_.string());
  }
  return records;
}

} // namespace store
} // namespace tutor
