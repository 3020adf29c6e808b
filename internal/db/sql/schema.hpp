#pragma once

#include <string>
#include <vector>

namespace roster::db::sql {

/*
  Bootstrap DDL, idempotent (CREATE ... IF NOT EXISTS).

  Uniqueness backstops enforced by every backend:
    assignments PRIMARY KEY (user_id, role_id, event_id)
    one row per (event_id, role_id) where unique_role
    user ids are opaque to assignments (no foreign key)
    events UNIQUE (location_id, event_date)
*/

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace roster::db::sql
