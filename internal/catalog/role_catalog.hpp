#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace roster::catalog {

struct Conflict {
  std::string       group;
  db::model::RoleRecord role;
};

/*
  RoleCatalog

  Immutable view of the role definitions and exclusion groups. Built once
  at startup; safe to share between threads without locking.

  Validation (InvalidCatalog on failure):
    - codes and display names are non-empty and unique
    - every group has a unique name and >= 2 distinct known roles
*/
class RoleCatalog {
 public:
  RoleCatalog(std::vector<db::model::RoleRecord> roles, std::vector<db::model::ExclusionGroupRecord> groups);

  static std::shared_ptr<const RoleCatalog> Load(db::Repository& repository);

  // By code first, then display name.
  std::optional<db::model::RoleRecord> Find(const std::string& name) const;
  std::optional<db::model::RoleRecord> FindById(int64_t role_id) const;

  // Display order: sort_order, then id.
  const std::vector<db::model::RoleRecord>& Roles() const {
    return roles_;
  }

  const std::vector<db::model::ExclusionGroupRecord>& Groups() const {
    return groups_;
  }

  std::vector<const db::model::ExclusionGroupRecord*> GroupsContaining(int64_t role_id) const;

  // First held role sharing a group with role_id, in group then held order.
  std::optional<Conflict> FindConflict(int64_t role_id, const std::vector<int64_t>& held_role_ids) const;

 private:
  std::vector<db::model::RoleRecord>           roles_;
  std::vector<db::model::ExclusionGroupRecord> groups_;

  std::unordered_map<int64_t, std::size_t>                  by_id_;
  std::unordered_map<std::string, std::size_t>              by_code_;
  std::unordered_map<std::string, std::size_t>              by_display_name_;
  std::unordered_map<int64_t, std::vector<std::size_t>>     groups_by_role_;
};

/*
  Upserts configured roles (by code) and replaces configured exclusion
  groups in one transaction. Group members are given as role codes.
*/
void SeedCatalog(db::Repository& repository, const roster::runtime::config::CatalogConfig& config);

} // namespace roster::catalog
