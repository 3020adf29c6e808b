#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <chrono>

namespace roster::db::sqlite {

using roster::db::ErrorCode;
using roster::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const { return st_ != nullptr; }
  sqlite3_stmt* get() const { return st_; }

  // Reads have no Result channel; a statement that will not prepare is fatal.
  sqlite3_stmt* OrThrow() const {
    if (!st_) throw DbError(ErrorCode::InternalError, sqlite3_errmsg(db_));
    return st_;
  }

private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

// Reads step through rows; anything other than ROW/DONE is a store failure.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  const int primary = rc & 0xff;
  throw DbError(primary == SQLITE_BUSY || primary == SQLITE_LOCKED ? ErrorCode::Busy : ErrorCode::InternalError, sqlite3_errmsg(db));
}

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

model::RoleRecord ReadRole(sqlite3_stmt* st) {
  model::RoleRecord r;
  r.id           = ColI64(st, 0);
  r.code         = ColText(st, 1);
  r.display_name = ColText(st, 2);
  r.is_unique    = ColBool(st, 3);
  r.sort_order   = static_cast<int32_t>(sqlite3_column_int(st, 4));
  return r;
}

model::LocationRecord ReadLocation(sqlite3_stmt* st) {
  model::LocationRecord l;
  l.id     = ColI64(st, 0);
  l.name   = ColText(st, 1);
  l.active = ColBool(st, 2);
  return l;
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
  model::EventRecord e;
  e.id            = ColI64(st, 0);
  e.location_id   = ColI64(st, 1);
  e.event_date    = ColText(st, 2);
  e.created_at_ms = static_cast<uint64_t>(ColI64(st, 3));
  return e;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Catalogue
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRole(Transaction& t, model::RoleRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO roles(code,display_name,is_unique,sort_order) VALUES(?,?,?,?) "
               "ON CONFLICT(code) DO UPDATE SET display_name=excluded.display_name,"
               "is_unique=excluded.is_unique,sort_order=excluded.sort_order "
               "RETURNING role_id;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.code);
  BindText(st.get(), 2, r.display_name);
  BindBool(st.get(), 3, r.is_unique);
  sqlite3_bind_int(st.get(), 4, r.sort_order);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) return Translate(db, rc);
  r.id = ColI64(st.get(), 0);

  // drain RETURNING so the statement completes
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
  }
  return Translate(db, rc);
}

std::optional<model::RoleRecord> SqliteRepository::GetRole(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();

  // code match wins over display-name match
  Statement st(db,
               "SELECT role_id,code,display_name,is_unique,sort_order FROM roles "
               "WHERE code=?1 OR display_name=?1 ORDER BY (code=?1) DESC LIMIT 1;");
  BindText(st.OrThrow(), 1, name);

  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadRole(st.get());
}

std::vector<model::RoleRecord> SqliteRepository::ListRoles(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT role_id,code,display_name,is_unique,sort_order FROM roles ORDER BY sort_order,role_id;");
  st.OrThrow();

  std::vector<model::RoleRecord> out;
  while (StepRow(db, st.get())) out.push_back(ReadRole(st.get()));
  return out;
}

Result SqliteRepository::ReplaceExclusionGroup(Transaction& t, const model::ExclusionGroupRecord& g) {
  auto* db = TX(t).Handle();

  {
    Statement st(db, "INSERT INTO exclusion_groups(name) VALUES(?) ON CONFLICT(name) DO NOTHING;");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, g.name);
    if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  }
  {
    Statement st(db, "DELETE FROM exclusion_group_roles WHERE group_name=?;");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, g.name);
    if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  }

  for (auto role_id : g.role_ids) {
    Statement st(db, "INSERT INTO exclusion_group_roles(group_name,role_id) VALUES(?,?);");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, g.name);
    BindI64(st.get(), 2, role_id);
    if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  }

  return Result::Ok();
}

std::vector<model::ExclusionGroupRecord> SqliteRepository::ListExclusionGroups(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT g.name, m.role_id FROM exclusion_groups g "
               "LEFT JOIN exclusion_group_roles m ON m.group_name=g.name "
               "ORDER BY g.name, m.role_id;");
  st.OrThrow();

  std::vector<model::ExclusionGroupRecord> out;
  while (StepRow(db, st.get())) {
    auto name = ColText(st.get(), 0);
    if (out.empty() || out.back().name != name) {
      out.push_back({});
      out.back().name = name;
    }
    if (sqlite3_column_type(st.get(), 1) != SQLITE_NULL) out.back().role_ids.push_back(ColI64(st.get(), 1));
  }
  return out;
}

// ------------------------------------------------------------------
// Assignments
// ------------------------------------------------------------------

Result SqliteRepository::LockEvent(Transaction& t, int64_t event_id) {
  // BEGIN IMMEDIATE already holds the database write lock.
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT 1 FROM events WHERE event_id=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindI64(st.get(), 1, event_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound, "event " + std::to_string(event_id));
  return Translate(db, rc);
}

bool SqliteRepository::HasAssignment(Transaction& t, int64_t user_id, int64_t role_id, int64_t event_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT 1 FROM assignments WHERE user_id=? AND role_id=? AND event_id=?;");
  BindI64(st.OrThrow(), 1, user_id);
  BindI64(st.get(), 2, role_id);
  BindI64(st.get(), 3, event_id);
  return StepRow(db, st.get());
}

bool SqliteRepository::IsRoleTaken(Transaction& t, int64_t role_id, int64_t event_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT 1 FROM assignments WHERE role_id=? AND event_id=? LIMIT 1;");
  BindI64(st.OrThrow(), 1, role_id);
  BindI64(st.get(), 2, event_id);
  return StepRow(db, st.get());
}

std::vector<model::RoleRecord> SqliteRepository::RolesHeldBy(Transaction& t, int64_t user_id, int64_t event_id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT r.role_id,r.code,r.display_name,r.is_unique,r.sort_order "
               "FROM assignments a JOIN roles r ON r.role_id=a.role_id "
               "WHERE a.user_id=? AND a.event_id=? ORDER BY r.sort_order,r.role_id;");
  BindI64(st.OrThrow(), 1, user_id);
  BindI64(st.get(), 2, event_id);

  std::vector<model::RoleRecord> out;
  while (StepRow(db, st.get())) out.push_back(ReadRole(st.get()));
  return out;
}

Result SqliteRepository::InsertAssignment(Transaction& t, const model::AssignmentRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO assignments(user_id,role_id,event_id,unique_role,created_at_ms) VALUES(?,?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, r.user_id);
  BindI64(st.get(), 2, r.role_id);
  BindI64(st.get(), 3, r.event_id);
  BindBool(st.get(), 4, r.unique_role);
  BindI64(st.get(), 5, static_cast<int64_t>(r.created_at_ms ? r.created_at_ms : NowMs()));

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteAssignments(Transaction& t, int64_t user_id, int64_t event_id, uint64_t& removed) {
  auto* db = TX(t).Handle();
  removed  = 0;

  Statement st(db, "DELETE FROM assignments WHERE user_id=? AND event_id=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindI64(st.get(), 1, user_id);
  BindI64(st.get(), 2, event_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) removed = static_cast<uint64_t>(sqlite3_changes(db));
  return Translate(db, rc);
}

std::vector<model::RosterRow> SqliteRepository::ListEventAssignees(Transaction& t, int64_t event_id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT a.role_id,a.user_id,COALESCE(u.full_name,''),COALESCE(u.handle,''),a.created_at_ms "
               "FROM assignments a LEFT JOIN users u ON u.user_id=a.user_id "
               "WHERE a.event_id=? ORDER BY a.created_at_ms,a.rowid;");
  BindI64(st.OrThrow(), 1, event_id);

  std::vector<model::RosterRow> out;
  while (StepRow(db, st.get())) {
    model::RosterRow row;
    row.role_id       = ColI64(st.get(), 0);
    row.user_id       = ColI64(st.get(), 1);
    row.full_name     = ColText(st.get(), 2);
    row.handle        = ColText(st.get(), 3);
    row.created_at_ms = static_cast<uint64_t>(ColI64(st.get(), 4));
    out.push_back(std::move(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Directory
// ------------------------------------------------------------------

Result SqliteRepository::InsertUser(Transaction& t, const model::UserRecord& u, bool& inserted) {
  auto* db = TX(t).Handle();
  inserted = false;

  Statement st(db,
               "INSERT INTO users(user_id,first_name,last_name,full_name,handle) VALUES(?,?,?,?,?) "
               "ON CONFLICT(user_id) DO NOTHING;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, u.id);
  BindText(st.get(), 2, u.first_name);
  BindText(st.get(), 3, u.last_name);
  BindText(st.get(), 4, u.full_name);
  BindText(st.get(), 5, u.handle);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) inserted = sqlite3_changes(db) == 1;
  return Translate(db, rc);
}

std::optional<model::UserRecord> SqliteRepository::GetUser(Transaction& t, int64_t user_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT user_id,first_name,last_name,full_name,handle FROM users WHERE user_id=?;");
  BindI64(st.OrThrow(), 1, user_id);

  if (!StepRow(db, st.get())) return std::nullopt;

  model::UserRecord u;
  u.id         = ColI64(st.get(), 0);
  u.first_name = ColText(st.get(), 1);
  u.last_name  = ColText(st.get(), 2);
  u.full_name  = ColText(st.get(), 3);
  u.handle     = ColText(st.get(), 4);
  return u;
}

Result SqliteRepository::UpsertLocation(Transaction& t, model::LocationRecord& l) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO locations(name,active) VALUES(?,?) "
               "ON CONFLICT(name) DO UPDATE SET active=excluded.active RETURNING location_id;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, l.name);
  BindBool(st.get(), 2, l.active);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) return Translate(db, rc);
  l.id = ColI64(st.get(), 0);

  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
  }
  return Translate(db, rc);
}

std::optional<model::LocationRecord> SqliteRepository::FindLocationByName(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT location_id,name,active FROM locations WHERE name=?;");
  BindText(st.OrThrow(), 1, name);

  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadLocation(st.get());
}

std::vector<model::LocationRecord> SqliteRepository::ListLocations(Transaction& t, bool active_only) {
  auto* db = TX(t).Handle();

  Statement st(db, active_only ? "SELECT location_id,name,active FROM locations WHERE active=1 ORDER BY name;"
                               : "SELECT location_id,name,active FROM locations ORDER BY name;");
  st.OrThrow();

  std::vector<model::LocationRecord> out;
  while (StepRow(db, st.get())) out.push_back(ReadLocation(st.get()));
  return out;
}

Result SqliteRepository::CreateEvent(Transaction& t, model::EventRecord& e) {
  auto* db = TX(t).Handle();
  if (e.created_at_ms == 0) e.created_at_ms = NowMs();

  Statement st(db, "INSERT INTO events(location_id,event_date,created_at_ms) VALUES(?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, e.location_id);
  BindText(st.get(), 2, e.event_date);
  BindI64(st.get(), 3, static_cast<int64_t>(e.created_at_ms));

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) e.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::optional<model::EventRecord> SqliteRepository::FindEvent(Transaction& t, int64_t location_id, const std::string& event_date) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT event_id,location_id,event_date,created_at_ms FROM events WHERE location_id=? AND event_date=?;");
  BindI64(st.OrThrow(), 1, location_id);
  BindText(st.get(), 2, event_date);

  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadEvent(st.get());
}

std::optional<model::EventRecord> SqliteRepository::GetEvent(Transaction& t, int64_t event_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT event_id,location_id,event_date,created_at_ms FROM events WHERE event_id=?;");
  BindI64(st.OrThrow(), 1, event_id);

  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadEvent(st.get());
}

} // namespace roster::db::sqlite
