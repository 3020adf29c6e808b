#pragma once

#include <cstdint>

namespace roster::db::model {

/*
  Persistent assignment row: "user fills role at event".

  IMPORTANT:
  - (user_id, role_id, event_id) is unique.
  - unique_role mirrors RoleRecord::is_unique so the store can enforce
    one row per (role_id, event_id) for unique roles.
  - Rows are inserted and deleted, never updated.
*/

struct AssignmentRecord {
  int64_t user_id  = 0;
  int64_t role_id  = 0;
  int64_t event_id = 0;

  bool unique_role = false;

  // epoch ms, filled by the store when 0
  uint64_t created_at_ms = 0;
};

} // namespace roster::db::model
