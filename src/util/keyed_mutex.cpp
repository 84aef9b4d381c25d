#include "util/keyed_mutex.hpp"

namespace tutor {
namespace util {

std::unique_lock<std::mutex> KeyedMutex::lock(const std::string& key) {
  std::mutex* key_mutex = nullptr;
  {
    std::lock_guard<std::mutex> guard(table_mutex_);
    auto& slot = mutexes_[key];
    if (!slot) {
      slot = std::make_unique<std::mutex>();
    }
    key_mutex = slot.get();
  }
  // Entries are never erased, so the pointer outlives the table lock
  return std::unique_lock<std::mutex>(*key_mutex);
}

std::size_t KeyedMutex::size() const {
  std::lock_guard<std::mutex> guard(table_mutex_);
  return mutexes_.size();
}

} // namespace util
} // namespace tutor
