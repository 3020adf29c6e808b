#pragma once

#include <cstdint>
#include <string>

namespace roster::db::model {

// One instance of the weekly activity; (location_id, event_date) is unique.
struct EventRecord {
  int64_t     id          = 0;
  int64_t     location_id = 0;
  std::string event_date;  // YYYY-MM-DD

  uint64_t created_at_ms = 0;
};

} // namespace roster::db::model
