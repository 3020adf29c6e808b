#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace roster::core {

/*
  One timed mutex per event id.

  Serializes Assign/Unassign for the same event inside this process;
  different events never contend. An entry is dropped once no guard holds
  or waits on it, so the table only tracks events in use.
*/
class EventLockTable {
 public:
  class Guard {
   public:
    Guard(std::shared_ptr<std::timed_mutex> mutex, std::unique_lock<std::timed_mutex> lock)
        : mutex_(std::move(mutex)), lock_(std::move(lock)) {
    }

   private:
    // declared first so the mutex outlives the lock
    std::shared_ptr<std::timed_mutex>  mutex_;
    std::unique_lock<std::timed_mutex> lock_;
  };

  // nullopt when the lock is not acquired within timeout.
  std::optional<Guard> Acquire(int64_t event_id, std::chrono::milliseconds timeout);

  std::size_t Size();

 private:
  std::mutex                                                     guard_;
  std::unordered_map<int64_t, std::shared_ptr<std::timed_mutex>> mutexes_;
};

} // namespace roster::core
