#include "schema.hpp"

namespace roster::db::sql {

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS roles (role_id INTEGER PRIMARY KEY AUTOINCREMENT, code TEXT NOT NULL UNIQUE, display_name TEXT NOT NULL UNIQUE, "
      "is_unique INTEGER NOT NULL DEFAULT 0, sort_order INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS exclusion_groups (name TEXT PRIMARY KEY);",
      "CREATE TABLE IF NOT EXISTS exclusion_group_roles (group_name TEXT NOT NULL REFERENCES exclusion_groups(name) ON DELETE CASCADE, "
      "role_id INTEGER NOT NULL REFERENCES roles(role_id), PRIMARY KEY (group_name, role_id));",
      "CREATE TABLE IF NOT EXISTS users (user_id INTEGER PRIMARY KEY, first_name TEXT NOT NULL DEFAULT '', last_name TEXT NOT NULL DEFAULT '', "
      "full_name TEXT NOT NULL DEFAULT '', handle TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS locations (location_id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL UNIQUE, active INTEGER NOT NULL DEFAULT 1);",
      "CREATE TABLE IF NOT EXISTS events (event_id INTEGER PRIMARY KEY AUTOINCREMENT, location_id INTEGER NOT NULL REFERENCES locations(location_id), "
      "event_date TEXT NOT NULL, created_at_ms INTEGER NOT NULL, UNIQUE (location_id, event_date));",
      "CREATE TABLE IF NOT EXISTS assignments (user_id INTEGER NOT NULL, role_id INTEGER NOT NULL REFERENCES roles(role_id), "
      "event_id INTEGER NOT NULL REFERENCES events(event_id), unique_role INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, "
      "PRIMARY KEY (user_id, role_id, event_id));",
      "CREATE UNIQUE INDEX IF NOT EXISTS assignments_unique_role ON assignments(event_id, role_id) WHERE unique_role = 1;",
      "CREATE INDEX IF NOT EXISTS assignments_by_event ON assignments(event_id, created_at_ms);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS roles (role_id BIGSERIAL PRIMARY KEY, code TEXT NOT NULL UNIQUE, display_name TEXT NOT NULL UNIQUE, "
      "is_unique BOOLEAN NOT NULL DEFAULT FALSE, sort_order INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS exclusion_groups (name TEXT PRIMARY KEY);",
      "CREATE TABLE IF NOT EXISTS exclusion_group_roles (group_name TEXT NOT NULL REFERENCES exclusion_groups(name) ON DELETE CASCADE, "
      "role_id BIGINT NOT NULL REFERENCES roles(role_id), PRIMARY KEY (group_name, role_id));",
      "CREATE TABLE IF NOT EXISTS users (user_id BIGINT PRIMARY KEY, first_name TEXT NOT NULL DEFAULT '', last_name TEXT NOT NULL DEFAULT '', "
      "full_name TEXT NOT NULL DEFAULT '', handle TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS locations (location_id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL UNIQUE, active BOOLEAN NOT NULL DEFAULT TRUE);",
      "CREATE TABLE IF NOT EXISTS events (event_id BIGSERIAL PRIMARY KEY, location_id BIGINT NOT NULL REFERENCES locations(location_id), "
      "event_date TEXT NOT NULL, created_at_ms BIGINT NOT NULL, UNIQUE (location_id, event_date));",
      "CREATE TABLE IF NOT EXISTS assignments (user_id BIGINT NOT NULL, role_id BIGINT NOT NULL REFERENCES roles(role_id), "
      "event_id BIGINT NOT NULL REFERENCES events(event_id), unique_role BOOLEAN NOT NULL DEFAULT FALSE, created_at_ms BIGINT NOT NULL, "
      "PRIMARY KEY (user_id, role_id, event_id));",
      "CREATE UNIQUE INDEX IF NOT EXISTS assignments_unique_role ON assignments(event_id, role_id) WHERE unique_role;",
      "CREATE INDEX IF NOT EXISTS assignments_by_event ON assignments(event_id, created_at_ms);"};
  return kSchema;
}

} // namespace roster::db::sql
