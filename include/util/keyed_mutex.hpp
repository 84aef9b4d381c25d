#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace tutor {
namespace util {

// One mutex per key (e.g. per username), created on first use and kept for the
// lifetime of the table. Only serializes threads within this process.
class KeyedMutex {
public:
  KeyedMutex() = default;
  KeyedMutex(const KeyedMutex&) = delete;
  KeyedMutex& operator=(const KeyedMutex&) = delete;

  // Blocks until the mutex for key is held by the returned lock
  std::unique_lock<std::mutex> lock(const std::string& key);

  std::size_t size() const;

private:
  mutable std::mutex table_mutex_;
  std::map<std::string, std::unique_ptr<std::mutex>> mutexes_;
};

} // namespace util
} // namespace tutor
