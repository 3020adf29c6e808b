#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace roster::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
