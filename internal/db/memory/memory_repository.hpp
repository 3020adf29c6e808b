#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <tuple>

#include "internal/db/api/repository.hpp"

namespace roster::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertRole(Transaction&, model::RoleRecord&) override;
  std::optional<model::RoleRecord> GetRole(Transaction&, const std::string&) override;
  std::vector<model::RoleRecord> ListRoles(Transaction&) override;
  Result ReplaceExclusionGroup(Transaction&, const model::ExclusionGroupRecord&) override;
  std::vector<model::ExclusionGroupRecord> ListExclusionGroups(Transaction&) override;

  Result LockEvent(Transaction&, int64_t event_id) override;
  bool HasAssignment(Transaction&, int64_t user_id, int64_t role_id, int64_t event_id) override;
  bool IsRoleTaken(Transaction&, int64_t role_id, int64_t event_id) override;
  std::vector<model::RoleRecord> RolesHeldBy(Transaction&, int64_t user_id, int64_t event_id) override;
  Result InsertAssignment(Transaction&, const model::AssignmentRecord&) override;
  Result DeleteAssignments(Transaction&, int64_t user_id, int64_t event_id, uint64_t& removed) override;
  std::vector<model::RosterRow> ListEventAssignees(Transaction&, int64_t event_id) override;

  Result InsertUser(Transaction&, const model::UserRecord&, bool& inserted) override;
  std::optional<model::UserRecord> GetUser(Transaction&, int64_t user_id) override;
  Result UpsertLocation(Transaction&, model::LocationRecord&) override;
  std::optional<model::LocationRecord> FindLocationByName(Transaction&, const std::string&) override;
  std::vector<model::LocationRecord> ListLocations(Transaction&, bool active_only) override;
  Result CreateEvent(Transaction&, model::EventRecord&) override;
  std::optional<model::EventRecord> FindEvent(Transaction&, int64_t location_id, const std::string& event_date) override;
  std::optional<model::EventRecord> GetEvent(Transaction&, int64_t event_id) override;

private:
  friend class MemoryTransaction;

  // (event_id, role_id, user_id)
  using AssignmentKey = std::tuple<int64_t, int64_t, int64_t>;

  struct State {
    std::map<int64_t, model::RoleRecord>               roles;
    std::map<std::string, model::ExclusionGroupRecord> exclusion_groups;
    std::map<int64_t, model::UserRecord>               users;
    std::map<int64_t, model::LocationRecord>           locations;
    std::map<int64_t, model::EventRecord>              events;
    std::map<AssignmentKey, model::AssignmentRecord>   assignments;
  };

  // A write replayed at commit against the latest committed state.
  using WriteOp = std::function<Result(State&)>;

  Result Apply(Transaction&, WriteOp op);

  std::mutex mutex_;
  State      committed_;

  // Ids are handed out at write time so a replay reproduces them.
  std::atomic<int64_t> next_role_id_{1};
  std::atomic<int64_t> next_location_id_{1};
  std::atomic<int64_t> next_event_id_{1};
};

}
