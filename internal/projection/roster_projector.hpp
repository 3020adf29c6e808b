#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/catalog/role_catalog.hpp"
#include "internal/db/api/repository.hpp"

namespace roster::projection {

struct RosterEntry {
  db::model::RoleRecord role;

  // empty when the role is unfilled
  std::optional<int64_t> assignee_user_id;
  std::string            assignee_name;
  std::string            assignee_handle;

  bool Filled() const {
    return assignee_user_id.has_value();
  }
};

/*
  Read-only "who fills what" view of one event.

  One entry per (role, assignee) in catalogue display order; several
  assignees of one role appear in assignment order; an unfilled role
  yields a single empty entry. Reads committed data only.
*/
class RosterProjector {
 public:
  RosterProjector(std::shared_ptr<db::Repository> repository, std::shared_ptr<const catalog::RoleCatalog> catalog);

  // Throws util::NotFound for an unknown event.
  std::vector<RosterEntry> Project(int64_t event_id) const;

 private:
  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<const catalog::RoleCatalog> catalog_;
};

} // namespace roster::projection
