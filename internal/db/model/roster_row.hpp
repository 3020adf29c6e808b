#pragma once

#include <cstdint>
#include <string>

namespace roster::db::model {

/*
  Assignment joined with its user, as read for roster display.
  full_name/handle are empty when the user row is missing.
*/

struct RosterRow {
  int64_t     role_id = 0;
  int64_t     user_id = 0;
  std::string full_name;
  std::string handle;

  uint64_t created_at_ms = 0;
};

} // namespace roster::db::model
