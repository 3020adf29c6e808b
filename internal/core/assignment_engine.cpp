#include "internal/core/assignment_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace roster::core {

using observability::IntField;
using observability::StringField;

namespace {

AssignResult Decline(DeclineReason reason, std::string role_name) {
  AssignResult result;
  result.reason    = reason;
  result.role_name = std::move(role_name);
  return result;
}

} // namespace

const char* ToString(DeclineReason reason) {
  switch (reason) {
    case DeclineReason::kNone:
      return "none";
    case DeclineReason::kRoleNotFound:
      return "role_not_found";
    case DeclineReason::kAlreadyAssignedSameRole:
      return "already_assigned_same_role";
    case DeclineReason::kRoleTaken:
      return "role_taken";
    case DeclineReason::kExclusionConflict:
      return "exclusion_conflict";
  }
  return "unknown";
}

std::string AssignResult::Describe() const {
  if (ok) {
    std::string text = "assigned " + role_name;
    if (!replaced_roles.empty()) {
      text += " (replaced ";
      for (std::size_t i = 0; i < replaced_roles.size(); ++i) {
        if (i) text += ", ";
        text += replaced_roles[i];
      }
      text += ")";
    }
    return text;
  }

  switch (reason) {
    case DeclineReason::kRoleNotFound:
      return "role '" + role_name + "' does not exist";
    case DeclineReason::kAlreadyAssignedSameRole:
      return "already assigned to " + role_name;
    case DeclineReason::kRoleTaken:
      return role_name + " is already taken";
    case DeclineReason::kExclusionConflict:
      return role_name + " cannot be combined with " + conflicting_role_name + " (" + exclusion_group + ")";
    case DeclineReason::kNone:
      break;
  }
  return "not assigned";
}

AssignmentEngine::AssignmentEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<const catalog::RoleCatalog> catalog,
                                   EngineOptions options)
    : repository_(std::move(repository)), catalog_(std::move(catalog)), options_(options) {
  if (!repository_) throw std::invalid_argument("AssignmentEngine: repository is null");
  if (!catalog_) throw std::invalid_argument("AssignmentEngine: catalog is null");
  if (options_.max_commit_attempts == 0) options_.max_commit_attempts = 1;
}

EventLockTable::Guard AssignmentEngine::LockEvent(int64_t event_id, const char* operation) {
  auto guard = locks_.Acquire(event_id, options_.lock_timeout);
  if (!guard) {
    ROSTER_LOG_ERROR("event lock timed out", {StringField("operation", operation), IntField("event_id", event_id),
                                              IntField("timeout_ms", options_.lock_timeout.count())});
    throw util::StoreUnavailable(std::string(operation) + ": timed out waiting for event " + std::to_string(event_id));
  }
  return std::move(*guard);
}

// ------------------------------------------------------------------
// Assign
// ------------------------------------------------------------------

AssignResult AssignmentEngine::Assign(const AssignRequest& request) {
  auto event_lock = LockEvent(request.event_id, "assign");

  db::Result last = db::Result::Ok();
  for (uint32_t attempt = 1; attempt <= options_.max_commit_attempts; ++attempt) {
    AssignResult result;
    try {
      last = TryAssign(request, result);
    } catch (const db::DbError& e) {
      last = db::Result::Err(e.code(), e.what());
    }

    if (last) {
      if (result.ok) {
        ROSTER_LOG_INFO("role assigned", {IntField("user_id", request.user_id), IntField("event_id", request.event_id),
                                          StringField("role", result.role_name),
                                          IntField("replaced", static_cast<int64_t>(result.replaced_roles.size()))});
      } else {
        ROSTER_LOG_DEBUG("assignment declined", {IntField("user_id", request.user_id), IntField("event_id", request.event_id),
                                                 StringField("role", request.role_name), StringField("reason", ToString(result.reason))});
      }
      return result;
    }

    if (!db::IsRetryable(last.code)) break;

    ROSTER_LOG_WARN("assign attempt failed, retrying",
                    {IntField("user_id", request.user_id), IntField("event_id", request.event_id), StringField("role", request.role_name),
                     IntField("attempt", attempt), StringField("code", db::ToString(last.code))});
  }

  if (last.code == db::ErrorCode::ConstraintViolation) {
    // storage backstop kept firing; someone else holds the slot
    auto role = catalog_->Find(request.role_name);
    return Decline(DeclineReason::kRoleTaken, role ? role->display_name : request.role_name);
  }

  ROSTER_LOG_ERROR("assign failed", {IntField("user_id", request.user_id), IntField("event_id", request.event_id),
                                     StringField("role", request.role_name), StringField("code", db::ToString(last.code)),
                                     StringField("error", last.message)});
  throw util::StoreUnavailable("assign: " + last.message);
}

db::Result AssignmentEngine::TryAssign(const AssignRequest& request, AssignResult& result) {
  auto  tx   = repository_->Begin();
  auto& repo = *repository_;

  if (auto r = repo.LockEvent(*tx, request.event_id); !r) {
    if (r.code == db::ErrorCode::NotFound) {
      throw util::NotFound("event " + std::to_string(request.event_id) + " does not exist");
    }
    return r;
  }

  auto role = repo.GetRole(*tx, request.role_name);
  if (!role) {
    result = Decline(DeclineReason::kRoleNotFound, request.role_name);
    tx->Rollback();
    return db::Result::Ok();
  }

  if (repo.HasAssignment(*tx, request.user_id, role->id, request.event_id)) {
    result = Decline(DeclineReason::kAlreadyAssignedSameRole, role->display_name);
    tx->Rollback();
    return db::Result::Ok();
  }

  if (role->is_unique && repo.IsRoleTaken(*tx, role->id, request.event_id)) {
    result = Decline(DeclineReason::kRoleTaken, role->display_name);
    tx->Rollback();
    return db::Result::Ok();
  }

  auto held = repo.RolesHeldBy(*tx, request.user_id, request.event_id);

  std::vector<std::string> replaced;
  if (options_.policy == ReassignPolicy::kAccumulate) {
    std::vector<int64_t> held_ids;
    held_ids.reserve(held.size());
    for (const auto& h : held) held_ids.push_back(h.id);

    if (auto conflict = catalog_->FindConflict(role->id, held_ids)) {
      result                       = Decline(DeclineReason::kExclusionConflict, role->display_name);
      result.conflicting_role_name = conflict->role.display_name;
      result.exclusion_group       = conflict->group;
      tx->Rollback();
      return db::Result::Ok();
    }
  } else if (!held.empty()) {
    uint64_t removed = 0;
    if (auto r = repo.DeleteAssignments(*tx, request.user_id, request.event_id, removed); !r) {
      return r;
    }
    for (const auto& h : held) replaced.push_back(h.display_name);
  }

  db::model::AssignmentRecord record;
  record.user_id       = request.user_id;
  record.role_id       = role->id;
  record.event_id      = request.event_id;
  record.unique_role   = role->is_unique;
  record.created_at_ms = util::ToUnixMillis(util::Now());

  if (auto r = repo.InsertAssignment(*tx, record); !r) {
    return r;
  }

  tx->Commit();

  result                = AssignResult{};
  result.ok             = true;
  result.role_name      = role->display_name;
  result.replaced_roles = std::move(replaced);
  return db::Result::Ok();
}

// ------------------------------------------------------------------
// Unassign
// ------------------------------------------------------------------

UnassignResult AssignmentEngine::Unassign(int64_t user_id, int64_t event_id) {
  auto event_lock = LockEvent(event_id, "unassign");

  db::Result last = db::Result::Ok();
  for (uint32_t attempt = 1; attempt <= options_.max_commit_attempts; ++attempt) {
    UnassignResult result;
    try {
      last = TryUnassign(user_id, event_id, result);
    } catch (const db::DbError& e) {
      last = db::Result::Err(e.code(), e.what());
    }

    if (last) {
      ROSTER_LOG_INFO("roles unassigned", {IntField("user_id", user_id), IntField("event_id", event_id),
                                           IntField("removed", static_cast<int64_t>(result.removed_count))});
      return result;
    }

    if (!db::IsRetryable(last.code)) break;
  }

  ROSTER_LOG_ERROR("unassign failed", {IntField("user_id", user_id), IntField("event_id", event_id), StringField("code", db::ToString(last.code)),
                                       StringField("error", last.message)});
  throw util::StoreUnavailable("unassign: " + last.message);
}

db::Result AssignmentEngine::TryUnassign(int64_t user_id, int64_t event_id, UnassignResult& result) {
  auto tx = repository_->Begin();

  if (auto r = repository_->LockEvent(*tx, event_id); !r) {
    if (r.code == db::ErrorCode::NotFound) {
      // nothing can be held at an event that does not exist
      tx->Rollback();
      return db::Result::Ok();
    }
    return r;
  }

  uint64_t removed = 0;
  if (auto r = repository_->DeleteAssignments(*tx, user_id, event_id, removed); !r) {
    return r;
  }
  tx->Commit();

  result.removed       = removed > 0;
  result.removed_count = removed;
  return db::Result::Ok();
}

} // namespace roster::core
