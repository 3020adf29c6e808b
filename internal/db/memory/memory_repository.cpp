#include "memory_repository.hpp"

#include <algorithm>
#include <chrono>

#include "memory_tx.hpp"

namespace roster::db::memory {

namespace {

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

bool RoleOrder(const model::RoleRecord& a, const model::RoleRecord& b) {
  if (a.sort_order != b.sort_order) return a.sort_order < b.sort_order;
  return a.id < b.id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::Apply(Transaction& t, WriteOp op) {
  auto& tx     = TX(t);
  auto  result = op(tx.Mutable());
  if (result) tx.Record(std::move(op));
  return result;
}

// ------------------------------------------------------------------
// Catalogue
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRole(Transaction& t, model::RoleRecord& r) {
  const auto& view = TX(t).View();
  auto        it   = std::find_if(view.roles.begin(), view.roles.end(), [&](const auto& e) { return e.second.code == r.code; });
  r.id             = it != view.roles.end() ? it->second.id : next_role_id_++;

  const model::RoleRecord role = r;
  return Apply(t, [role](State& s) {
    for (const auto& [id, existing] : s.roles) {
      if (id != role.id && (existing.code == role.code || existing.display_name == role.display_name)) {
        return Result::Err(ErrorCode::ConstraintViolation, "role code or display name already used: " + role.code);
      }
    }
    s.roles[role.id] = role;
    return Result::Ok();
  });
}

std::optional<model::RoleRecord> MemoryRepository::GetRole(Transaction& t, const std::string& name) {
  const auto& s = TX(t).View();
  for (const auto& [_, role] : s.roles)
    if (role.code == name) return role;
  for (const auto& [_, role] : s.roles)
    if (role.display_name == name) return role;
  return std::nullopt;
}

std::vector<model::RoleRecord> MemoryRepository::ListRoles(Transaction& t) {
  const auto&                    s = TX(t).View();
  std::vector<model::RoleRecord> out;
  out.reserve(s.roles.size());
  for (const auto& [_, role] : s.roles) out.push_back(role);
  std::sort(out.begin(), out.end(), RoleOrder);
  return out;
}

Result MemoryRepository::ReplaceExclusionGroup(Transaction& t, const model::ExclusionGroupRecord& g) {
  return Apply(t, [g](State& s) {
    for (auto role_id : g.role_ids) {
      if (!s.roles.contains(role_id)) {
        return Result::Err(ErrorCode::ConstraintViolation, "exclusion group references unknown role: " + std::to_string(role_id));
      }
    }
    s.exclusion_groups[g.name] = g;
    return Result::Ok();
  });
}

std::vector<model::ExclusionGroupRecord> MemoryRepository::ListExclusionGroups(Transaction& t) {
  std::vector<model::ExclusionGroupRecord> out;
  for (const auto& [_, group] : TX(t).View().exclusion_groups) out.push_back(group);
  return out;
}

// ------------------------------------------------------------------
// Assignments
// ------------------------------------------------------------------

Result MemoryRepository::LockEvent(Transaction& t, int64_t event_id) {
  // Writers are serialized by commit-time replay; only existence is checked.
  if (!TX(t).View().events.contains(event_id)) {
    return Result::Err(ErrorCode::NotFound, "event " + std::to_string(event_id));
  }
  return Result::Ok();
}

bool MemoryRepository::HasAssignment(Transaction& t, int64_t user_id, int64_t role_id, int64_t event_id) {
  return TX(t).View().assignments.contains({event_id, role_id, user_id});
}

bool MemoryRepository::IsRoleTaken(Transaction& t, int64_t role_id, int64_t event_id) {
  const auto& a  = TX(t).View().assignments;
  auto        it = a.lower_bound({event_id, role_id, INT64_MIN});
  return it != a.end() && std::get<0>(it->first) == event_id && std::get<1>(it->first) == role_id;
}

std::vector<model::RoleRecord> MemoryRepository::RolesHeldBy(Transaction& t, int64_t user_id, int64_t event_id) {
  const auto&                    s = TX(t).View();
  std::vector<model::RoleRecord> out;
  for (auto it = s.assignments.lower_bound({event_id, INT64_MIN, INT64_MIN}); it != s.assignments.end() && std::get<0>(it->first) == event_id;
       ++it) {
    if (it->second.user_id != user_id) continue;
    auto role = s.roles.find(it->second.role_id);
    if (role != s.roles.end()) out.push_back(role->second);
  }
  std::sort(out.begin(), out.end(), RoleOrder);
  return out;
}

Result MemoryRepository::InsertAssignment(Transaction& t, const model::AssignmentRecord& r) {
  auto record = r;
  if (record.created_at_ms == 0) record.created_at_ms = NowMs();

  return Apply(t, [record](State& s) {
    const AssignmentKey key{record.event_id, record.role_id, record.user_id};
    if (s.assignments.contains(key)) {
      return Result::Err(ErrorCode::ConstraintViolation, "assignment already exists");
    }
    if (record.unique_role) {
      auto it = s.assignments.lower_bound({record.event_id, record.role_id, INT64_MIN});
      if (it != s.assignments.end() && std::get<0>(it->first) == record.event_id && std::get<1>(it->first) == record.role_id) {
        return Result::Err(ErrorCode::ConstraintViolation, "unique role already assigned");
      }
    }
    s.assignments.emplace(key, record);
    return Result::Ok();
  });
}

Result MemoryRepository::DeleteAssignments(Transaction& t, int64_t user_id, int64_t event_id, uint64_t& removed) {
  removed = 0;
  for (const auto& [key, record] : TX(t).View().assignments) {
    if (record.event_id == event_id && record.user_id == user_id) ++removed;
  }

  return Apply(t, [user_id, event_id](State& s) {
    std::erase_if(s.assignments, [&](const auto& e) { return e.second.event_id == event_id && e.second.user_id == user_id; });
    return Result::Ok();
  });
}

std::vector<model::RosterRow> MemoryRepository::ListEventAssignees(Transaction& t, int64_t event_id) {
  const auto&                   s = TX(t).View();
  std::vector<model::RosterRow> out;
  for (const auto& [key, record] : s.assignments) {
    if (record.event_id != event_id) continue;

    model::RosterRow row;
    row.role_id       = record.role_id;
    row.user_id       = record.user_id;
    row.created_at_ms = record.created_at_ms;
    if (auto user = s.users.find(record.user_id); user != s.users.end()) {
      row.full_name = user->second.full_name;
      row.handle    = user->second.handle;
    }
    out.push_back(std::move(row));
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms; });
  return out;
}

// ------------------------------------------------------------------
// Directory
// ------------------------------------------------------------------

Result MemoryRepository::InsertUser(Transaction& t, const model::UserRecord& u, bool& inserted) {
  inserted = !TX(t).View().users.contains(u.id);
  if (!inserted) return Result::Ok();

  return Apply(t, [u](State& s) {
    // another transaction registered the same id after our snapshot
    if (!s.users.emplace(u.id, u).second) {
      return Result::Err(ErrorCode::ConstraintViolation, "user already exists: " + std::to_string(u.id));
    }
    return Result::Ok();
  });
}

std::optional<model::UserRecord> MemoryRepository::GetUser(Transaction& t, int64_t user_id) {
  const auto& s  = TX(t).View();
  auto        it = s.users.find(user_id);
  if (it == s.users.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertLocation(Transaction& t, model::LocationRecord& l) {
  const auto& view = TX(t).View();
  auto it = std::find_if(view.locations.begin(), view.locations.end(), [&](const auto& e) { return e.second.name == l.name; });
  l.id    = it != view.locations.end() ? it->second.id : next_location_id_++;

  const model::LocationRecord location = l;
  return Apply(t, [location](State& s) {
    for (const auto& [id, existing] : s.locations) {
      if (id != location.id && existing.name == location.name) {
        return Result::Err(ErrorCode::ConstraintViolation, "location name already used: " + location.name);
      }
    }
    s.locations[location.id] = location;
    return Result::Ok();
  });
}

std::optional<model::LocationRecord> MemoryRepository::FindLocationByName(Transaction& t, const std::string& name) {
  for (const auto& [_, location] : TX(t).View().locations)
    if (location.name == name) return location;
  return std::nullopt;
}

std::vector<model::LocationRecord> MemoryRepository::ListLocations(Transaction& t, bool active_only) {
  std::vector<model::LocationRecord> out;
  for (const auto& [_, location] : TX(t).View().locations) {
    if (active_only && !location.active) continue;
    out.push_back(location);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.name < b.name; });
  return out;
}

Result MemoryRepository::CreateEvent(Transaction& t, model::EventRecord& e) {
  e.id = next_event_id_++;
  if (e.created_at_ms == 0) e.created_at_ms = NowMs();

  const model::EventRecord event = e;
  return Apply(t, [event](State& s) {
    if (!s.locations.contains(event.location_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "event references unknown location: " + std::to_string(event.location_id));
    }
    for (const auto& [_, existing] : s.events) {
      if (existing.location_id == event.location_id && existing.event_date == event.event_date) {
        return Result::Err(ErrorCode::ConstraintViolation, "event already exists for location and date");
      }
    }
    s.events[event.id] = event;
    return Result::Ok();
  });
}

std::optional<model::EventRecord> MemoryRepository::FindEvent(Transaction& t, int64_t location_id, const std::string& event_date) {
  for (const auto& [_, event] : TX(t).View().events)
    if (event.location_id == location_id && event.event_date == event_date) return event;
  return std::nullopt;
}

std::optional<model::EventRecord> MemoryRepository::GetEvent(Transaction& t, int64_t event_id) {
  const auto& s  = TX(t).View();
  auto        it = s.events.find(event_id);
  if (it == s.events.end()) return std::nullopt;
  return it->second;
}

} // namespace roster::db::memory
