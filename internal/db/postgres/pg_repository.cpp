#include "pg_repository.hpp"

#include <chrono>

namespace roster::db::postgres {

namespace {

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

model::RoleRecord ReadRole(const pqxx::row& row) {
  model::RoleRecord r;
  r.id           = row[0].as<int64_t>();
  r.code         = row[1].c_str();
  r.display_name = row[2].c_str();
  r.is_unique    = row[3].as<bool>();
  r.sort_order   = row[4].as<int32_t>();
  return r;
}

model::LocationRecord ReadLocation(const pqxx::row& row) {
  model::LocationRecord l;
  l.id     = row[0].as<int64_t>();
  l.name   = row[1].c_str();
  l.active = row[2].as<bool>();
  return l;
}

model::EventRecord ReadEvent(const pqxx::row& row) {
  model::EventRecord e;
  e.id            = row[0].as<int64_t>();
  e.location_id   = row[1].as<int64_t>();
  e.event_date    = row[2].c_str();
  e.created_at_ms = row[3].as<uint64_t>();
  return e;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool, std::chrono::milliseconds statement_timeout)
    : pool_(std::move(pool)), statement_timeout_(statement_timeout) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return Read([&] { return std::make_unique<PgTransaction>(pool_, statement_timeout_); });
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

// ------------------------------------------------------------------
// Catalogue
// ------------------------------------------------------------------

Result PgRepository::UpsertRole(Transaction& t, model::RoleRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO roles(code,display_name,is_unique,sort_order) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(code) DO UPDATE SET display_name=EXCLUDED.display_name,is_unique=EXCLUDED.is_unique,sort_order=EXCLUDED.sort_order "
        "RETURNING role_id;",
        r.code, r.display_name, r.is_unique, r.sort_order);
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RoleRecord> PgRepository::GetRole(Transaction& t, const std::string& name) {
  auto res = Read([&] {
    return TX(t).Work().exec_params(
        "SELECT role_id,code,display_name,is_unique,sort_order FROM roles "
        "WHERE code=$1 OR display_name=$1 ORDER BY (code=$1) DESC LIMIT 1;",
        name);
  });
  if (res.empty()) return std::nullopt;
  return ReadRole(res[0]);
}

std::vector<model::RoleRecord> PgRepository::ListRoles(Transaction& t) {
  auto res = Read([&] { return TX(t).Work().exec("SELECT role_id,code,display_name,is_unique,sort_order FROM roles ORDER BY sort_order,role_id;"); });

  std::vector<model::RoleRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadRole(row));
  return out;
}

Result PgRepository::ReplaceExclusionGroup(Transaction& t, const model::ExclusionGroupRecord& g) {
  try {
    auto& w = TX(t).Work();
    w.exec_params("INSERT INTO exclusion_groups(name) VALUES($1) ON CONFLICT(name) DO NOTHING;", g.name);
    w.exec_params("DELETE FROM exclusion_group_roles WHERE group_name=$1;", g.name);
    for (auto role_id : g.role_ids) {
      w.exec_params("INSERT INTO exclusion_group_roles(group_name,role_id) VALUES($1,$2);", g.name, role_id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ExclusionGroupRecord> PgRepository::ListExclusionGroups(Transaction& t) {
  auto res = Read([&] {
    return TX(t).Work().exec(
        "SELECT g.name, m.role_id FROM exclusion_groups g "
        "LEFT JOIN exclusion_group_roles m ON m.group_name=g.name "
        "ORDER BY g.name, m.role_id;");
  });

  std::vector<model::ExclusionGroupRecord> out;
  for (const auto& row : res) {
    std::string name = row[0].c_str();
    if (out.empty() || out.back().name != name) {
      out.push_back({});
      out.back().name = name;
    }
    if (!row[1].is_null()) out.back().role_ids.push_back(row[1].as<int64_t>());
  }
  return out;
}

// ------------------------------------------------------------------
// Assignments
// ------------------------------------------------------------------

Result PgRepository::LockEvent(Transaction& t, int64_t event_id) {
  try {
    auto res = TX(t).Work().exec_params("SELECT event_id FROM events WHERE event_id=$1 FOR UPDATE;", event_id);
    if (res.empty()) return Result::Err(ErrorCode::NotFound, "event " + std::to_string(event_id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

bool PgRepository::HasAssignment(Transaction& t, int64_t user_id, int64_t role_id, int64_t event_id) {
  auto res = Read([&] {
    return TX(t).Work().exec_params("SELECT 1 FROM assignments WHERE user_id=$1 AND role_id=$2 AND event_id=$3;", user_id, role_id, event_id);
  });
  return !res.empty();
}

bool PgRepository::IsRoleTaken(Transaction& t, int64_t role_id, int64_t event_id) {
  auto res = Read([&] { return TX(t).Work().exec_params("SELECT 1 FROM assignments WHERE role_id=$1 AND event_id=$2 LIMIT 1;", role_id, event_id); });
  return !res.empty();
}

std::vector<model::RoleRecord> PgRepository::RolesHeldBy(Transaction& t, int64_t user_id, int64_t event_id) {
  auto res = Read([&] {
    return TX(t).Work().exec_params(
        "SELECT r.role_id,r.code,r.display_name,r.is_unique,r.sort_order "
        "FROM assignments a JOIN roles r ON r.role_id=a.role_id "
        "WHERE a.user_id=$1 AND a.event_id=$2 ORDER BY r.sort_order,r.role_id;",
        user_id, event_id);
  });

  std::vector<model::RoleRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadRole(row));
  return out;
}

Result PgRepository::InsertAssignment(Transaction& t, const model::AssignmentRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO assignments(user_id,role_id,event_id,unique_role,created_at_ms) VALUES($1,$2,$3,$4,$5);", r.user_id,
                             r.role_id, r.event_id, r.unique_role, r.created_at_ms ? r.created_at_ms : NowMs());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteAssignments(Transaction& t, int64_t user_id, int64_t event_id, uint64_t& removed) {
  removed = 0;
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM assignments WHERE user_id=$1 AND event_id=$2;", user_id, event_id);
    removed  = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RosterRow> PgRepository::ListEventAssignees(Transaction& t, int64_t event_id) {
  auto res = Read([&] {
    return TX(t).Work().exec_params(
        "SELECT a.role_id,a.user_id,COALESCE(u.full_name,''),COALESCE(u.handle,''),a.created_at_ms "
        "FROM assignments a LEFT JOIN users u ON u.user_id=a.user_id "
        "WHERE a.event_id=$1 ORDER BY a.created_at_ms,a.ctid;",
        event_id);
  });

  std::vector<model::RosterRow> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::RosterRow r;
    r.role_id       = row[0].as<int64_t>();
    r.user_id       = row[1].as<int64_t>();
    r.full_name     = row[2].c_str();
    r.handle        = row[3].c_str();
    r.created_at_ms = row[4].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Directory
// ------------------------------------------------------------------

Result PgRepository::InsertUser(Transaction& t, const model::UserRecord& u, bool& inserted) {
  inserted = false;
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO users(user_id,first_name,last_name,full_name,handle) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT(user_id) DO NOTHING;",
        u.id, u.first_name, u.last_name, u.full_name, u.handle);
    inserted = res.affected_rows() == 1;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UserRecord> PgRepository::GetUser(Transaction& t, int64_t user_id) {
  auto res = Read([&] { return TX(t).Work().exec_params("SELECT user_id,first_name,last_name,full_name,handle FROM users WHERE user_id=$1;", user_id); });
  if (res.empty()) return std::nullopt;

  model::UserRecord u;
  u.id         = res[0][0].as<int64_t>();
  u.first_name = res[0][1].c_str();
  u.last_name  = res[0][2].c_str();
  u.full_name  = res[0][3].c_str();
  u.handle     = res[0][4].c_str();
  return u;
}

Result PgRepository::UpsertLocation(Transaction& t, model::LocationRecord& l) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO locations(name,active) VALUES($1,$2) ON CONFLICT(name) DO UPDATE SET active=EXCLUDED.active RETURNING location_id;", l.name,
        l.active);
    l.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LocationRecord> PgRepository::FindLocationByName(Transaction& t, const std::string& name) {
  auto res = Read([&] { return TX(t).Work().exec_params("SELECT location_id,name,active FROM locations WHERE name=$1;", name); });
  if (res.empty()) return std::nullopt;
  return ReadLocation(res[0]);
}

std::vector<model::LocationRecord> PgRepository::ListLocations(Transaction& t, bool active_only) {
  auto res = Read([&] {
    return TX(t).Work().exec(active_only ? "SELECT location_id,name,active FROM locations WHERE active ORDER BY name;"
                                         : "SELECT location_id,name,active FROM locations ORDER BY name;");
  });

  std::vector<model::LocationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadLocation(row));
  return out;
}

Result PgRepository::CreateEvent(Transaction& t, model::EventRecord& e) {
  if (e.created_at_ms == 0) e.created_at_ms = NowMs();
  try {
    auto res = TX(t).Work().exec_params("INSERT INTO events(location_id,event_date,created_at_ms) VALUES($1,$2,$3) RETURNING event_id;",
                                        e.location_id, e.event_date, e.created_at_ms);
    e.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e2) {
    return Translate(e2);
  }
}

std::optional<model::EventRecord> PgRepository::FindEvent(Transaction& t, int64_t location_id, const std::string& event_date) {
  auto res = Read([&] {
    return TX(t).Work().exec_params("SELECT event_id,location_id,event_date,created_at_ms FROM events WHERE location_id=$1 AND event_date=$2;",
                                    location_id, event_date);
  });
  if (res.empty()) return std::nullopt;
  return ReadEvent(res[0]);
}

std::optional<model::EventRecord> PgRepository::GetEvent(Transaction& t, int64_t event_id) {
  auto res = Read([&] { return TX(t).Work().exec_params("SELECT event_id,location_id,event_date,created_at_ms FROM events WHERE event_id=$1;", event_id); });
  if (res.empty()) return std::nullopt;
  return ReadEvent(res[0]);
}

} // namespace roster::db::postgres
