#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/catalog/role_catalog.hpp"
#include "internal/core/event_lock_table.hpp"
#include "internal/db/api/repository.hpp"

namespace roster::core {

enum class DeclineReason {
  kNone,
  kRoleNotFound,
  kAlreadyAssignedSameRole,
  kRoleTaken,
  kExclusionConflict,
};

const char* ToString(DeclineReason reason);

enum class ReassignPolicy {
  // Users may hold several non-conflicting roles; a change of role needs
  // an explicit Unassign.
  kAccumulate,
  // Assign drops every other role the user holds at the event.
  kReplace,
};

struct EngineOptions {
  ReassignPolicy            policy = ReassignPolicy::kAccumulate;
  std::chrono::milliseconds lock_timeout{5000};
  uint32_t                  max_commit_attempts = 3;
};

struct AssignRequest {
  int64_t     user_id  = 0;
  int64_t     event_id = 0;
  std::string role_name;  // code or display name
};

struct AssignResult {
  bool          ok     = false;
  DeclineReason reason = DeclineReason::kNone;

  std::string role_name;
  std::string conflicting_role_name;
  std::string exclusion_group;

  // kReplace only: roles removed to make room
  std::vector<std::string> replaced_roles;

  std::string Describe() const;
};

struct UnassignResult {
  bool     removed       = false;
  uint64_t removed_count = 0;
};

/*
  AssignmentEngine

  Decides and commits single assignments.

  Assign checks, in order, inside one store transaction:
    1. role resolves (code, then display name)   -> kRoleNotFound
    2. user already holds this role              -> kAlreadyAssignedSameRole
    3. unique role held by anyone                -> kRoleTaken
    4. user holds another member of a group      -> kExclusionConflict
    5. insert + commit

  Declines are values. A storage uniqueness failure is retried so the
  fresh transaction reports the precise decline; if it persists the result
  is kRoleTaken. Any other store failure throws util::StoreUnavailable.
  An unknown event throws util::NotFound.
*/
class AssignmentEngine {
 public:
  AssignmentEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<const catalog::RoleCatalog> catalog, EngineOptions options = {});

  AssignResult Assign(const AssignRequest& request);

  // Removes every role the user holds at the event.
  UnassignResult Unassign(int64_t user_id, int64_t event_id);

  const EngineOptions& Options() const {
    return options_;
  }

 private:
  EventLockTable::Guard LockEvent(int64_t event_id, const char* operation);

  db::Result TryAssign(const AssignRequest& request, AssignResult& result);
  db::Result TryUnassign(int64_t user_id, int64_t event_id, UnassignResult& result);

  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<const catalog::RoleCatalog> catalog_;
  EngineOptions                              options_;
  EventLockTable                             locks_;
};

} // namespace roster::core
