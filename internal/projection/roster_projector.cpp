#include "internal/projection/roster_projector.hpp"

#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace roster::projection {

RosterProjector::RosterProjector(std::shared_ptr<db::Repository> repository, std::shared_ptr<const catalog::RoleCatalog> catalog)
    : repository_(std::move(repository)), catalog_(std::move(catalog)) {
}

std::vector<RosterEntry> RosterProjector::Project(int64_t event_id) const {
  std::vector<db::model::RosterRow> rows;
  try {
    auto tx = repository_->Begin();
    if (!repository_->GetEvent(*tx, event_id)) {
      throw util::NotFound("event " + std::to_string(event_id) + " does not exist");
    }
    rows = repository_->ListEventAssignees(*tx, event_id);
    tx->Commit();
  } catch (const db::DbError& e) {
    ROSTER_LOG_ERROR("roster read failed", {observability::IntField("event_id", event_id), observability::StringField("code", db::ToString(e.code())),
                                            observability::StringField("error", e.what())});
    throw util::StoreUnavailable("roster: " + std::string(e.what()));
  }

  // rows arrive in assignment order; bucketing keeps it
  std::unordered_map<int64_t, std::vector<const db::model::RosterRow*>> by_role;
  for (const auto& row : rows) by_role[row.role_id].push_back(&row);

  std::vector<RosterEntry> out;
  out.reserve(catalog_->Roles().size() + rows.size());
  for (const auto& role : catalog_->Roles()) {
    auto it = by_role.find(role.id);
    if (it == by_role.end()) {
      out.push_back(RosterEntry{role, std::nullopt, {}, {}});
      continue;
    }
    for (const auto* row : it->second) {
      out.push_back(RosterEntry{role, row->user_id, row->full_name, row->handle});
    }
  }
  return out;
}

} // namespace roster::projection
