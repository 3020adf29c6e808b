#pragma once

#include <chrono>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace roster::db::postgres {

class PgRepository final : public db::Repository {
public:
  PgRepository(std::shared_ptr<PgPool> pool, std::chrono::milliseconds statement_timeout = std::chrono::milliseconds(0));

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
  std::shared_ptr<PgPool> pool_;
  std::chrono::milliseconds statement_timeout_;

  static PgTransaction& TX(Transaction& t);

  // Runs a read and rethrows backend failures as DbError.
  template <typename Fn>
  static auto Read(Fn&& fn) -> decltype(fn()) {
    try {
      return fn();
    } catch (const DbError&) {
      throw;
    } catch (const std::exception& e) {
      throw DbError(Translate(e));
    }
  }
};

}
