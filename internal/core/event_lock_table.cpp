#include "internal/core/event_lock_table.hpp"

namespace roster::core {

std::optional<EventLockTable::Guard> EventLockTable::Acquire(int64_t event_id, std::chrono::milliseconds timeout) {
  std::shared_ptr<std::timed_mutex> mutex;
  {
    std::lock_guard<std::mutex> lock(guard_);
    // the map holds the only reference to idle entries; copies are made
    // under guard_, so an idle entry cannot be picked up concurrently
    std::erase_if(mutexes_, [](const auto& entry) { return entry.second.use_count() == 1; });

    auto& slot = mutexes_[event_id];
    if (!slot) {
      slot = std::make_shared<std::timed_mutex>();
    }
    mutex = slot;
  }

  std::unique_lock<std::timed_mutex> lock(*mutex, std::defer_lock);
  if (!lock.try_lock_for(timeout)) {
    return std::nullopt;
  }
  return Guard(std::move(mutex), std::move(lock));
}

std::size_t EventLockTable::Size() {
  std::lock_guard<std::mutex> lock(guard_);
  return mutexes_.size();
}

} // namespace roster::core
