#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/assignment_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/exclusion_group_record.hpp"
#include "internal/db/model/location_record.hpp"
#include "internal/db/model/role_record.hpp"
#include "internal/db/model/roster_row.hpp"
#include "internal/db/model/user_record.hpp"

namespace roster::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - InsertAssignment refuses a duplicate (user, role, event) triple and a
    second row for a unique role at the same event, even when the caller's
    own checks passed (storage backstop against lost-update races)
  - Writes return Result; reads throw DbError on backend failure

  The DB is the source of truth for:
    catalogue (roles, exclusion groups)
    users, locations, events
    assignments
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Catalogue
  // ---------------------------------------------------------------------

  // Inserts or updates by code; fills role.id.
  virtual Result UpsertRole(Transaction&, model::RoleRecord& role) = 0;

  // Resolves by code first, then by display name.
  virtual std::optional<model::RoleRecord> GetRole(Transaction&, const std::string& name) = 0;

  // Ordered by sort_order, then id.
  virtual std::vector<model::RoleRecord> ListRoles(Transaction&) = 0;

  virtual Result ReplaceExclusionGroup(Transaction&, const model::ExclusionGroupRecord& group) = 0;

  virtual std::vector<model::ExclusionGroupRecord> ListExclusionGroups(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Assignments
  // ---------------------------------------------------------------------

  // Serializes writers of one event for the rest of the transaction where
  // the backend supports row locks. NotFound if the event does not exist.
  virtual Result LockEvent(Transaction&, int64_t event_id) = 0;

  virtual bool HasAssignment(Transaction&, int64_t user_id, int64_t role_id, int64_t event_id) = 0;

  // Any user holds the role at the event.
  virtual bool IsRoleTaken(Transaction&, int64_t role_id, int64_t event_id) = 0;

  virtual std::vector<model::RoleRecord> RolesHeldBy(Transaction&, int64_t user_id, int64_t event_id) = 0;

  // ConstraintViolation when a uniqueness constraint would break.
  virtual Result InsertAssignment(Transaction&, const model::AssignmentRecord& record) = 0;

  // Removes every role the user holds at the event.
  virtual Result DeleteAssignments(Transaction&, int64_t user_id, int64_t event_id, uint64_t& removed) = 0;

  // Ordered by assignment time.
  virtual std::vector<model::RosterRow> ListEventAssignees(Transaction&, int64_t event_id) = 0;

  // ---------------------------------------------------------------------
  // Directory
  // ---------------------------------------------------------------------

  // Never overwrites an existing profile; inserted is false when the id was
  // already present.
  virtual Result InsertUser(Transaction&, const model::UserRecord& user, bool& inserted) = 0;

  virtual std::optional<model::UserRecord> GetUser(Transaction&, int64_t user_id) = 0;

  // Inserts or updates by name; fills location.id.
  virtual Result UpsertLocation(Transaction&, model::LocationRecord& location) = 0;

  virtual std::optional<model::LocationRecord> FindLocationByName(Transaction&, const std::string& name) = 0;

  // Ordered by name.
  virtual std::vector<model::LocationRecord> ListLocations(Transaction&, bool active_only) = 0;

  // Fills event.id; ConstraintViolation if (location, date) already exists.
  virtual Result CreateEvent(Transaction&, model::EventRecord& event) = 0;

  virtual std::optional<model::EventRecord> FindEvent(Transaction&, int64_t location_id, const std::string& event_date) = 0;

  virtual std::optional<model::EventRecord> GetEvent(Transaction&, int64_t event_id) = 0;
};

} // namespace roster::db
