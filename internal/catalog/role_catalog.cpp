#include "internal/catalog/role_catalog.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace roster::catalog {

using db::model::ExclusionGroupRecord;
using db::model::RoleRecord;

RoleCatalog::RoleCatalog(std::vector<RoleRecord> roles, std::vector<ExclusionGroupRecord> groups)
    : roles_(std::move(roles)), groups_(std::move(groups)) {
  std::sort(roles_.begin(), roles_.end(), [](const RoleRecord& a, const RoleRecord& b) {
    if (a.sort_order != b.sort_order) return a.sort_order < b.sort_order;
    return a.id < b.id;
  });

  for (std::size_t i = 0; i < roles_.size(); ++i) {
    const auto& role = roles_[i];
    if (role.code.empty() || role.display_name.empty()) {
      throw util::InvalidCatalog("role " + std::to_string(role.id) + " has an empty code or display name");
    }
    if (!by_id_.emplace(role.id, i).second) {
      throw util::InvalidCatalog("duplicate role id " + std::to_string(role.id));
    }
    if (!by_code_.emplace(role.code, i).second) {
      throw util::InvalidCatalog("duplicate role code " + role.code);
    }
    if (!by_display_name_.emplace(role.display_name, i).second) {
      throw util::InvalidCatalog("duplicate role display name " + role.display_name);
    }
  }

  std::unordered_set<std::string> group_names;
  for (std::size_t g = 0; g < groups_.size(); ++g) {
    auto& group = groups_[g];
    if (group.name.empty() || !group_names.insert(group.name).second) {
      throw util::InvalidCatalog("exclusion group name is empty or duplicated: '" + group.name + "'");
    }

    std::sort(group.role_ids.begin(), group.role_ids.end());
    group.role_ids.erase(std::unique(group.role_ids.begin(), group.role_ids.end()), group.role_ids.end());
    if (group.role_ids.size() < 2) {
      throw util::InvalidCatalog("exclusion group " + group.name + " needs at least two distinct roles");
    }

    for (auto role_id : group.role_ids) {
      if (!by_id_.contains(role_id)) {
        throw util::InvalidCatalog("exclusion group " + group.name + " references unknown role " + std::to_string(role_id));
      }
      groups_by_role_[role_id].push_back(g);
    }
  }
}

std::shared_ptr<const RoleCatalog> RoleCatalog::Load(db::Repository& repository) {
  auto tx     = repository.Begin();
  auto roles  = repository.ListRoles(*tx);
  auto groups = repository.ListExclusionGroups(*tx);
  tx->Commit();

  auto catalog = std::make_shared<const RoleCatalog>(std::move(roles), std::move(groups));
  ROSTER_LOG_INFO("role catalog loaded", {observability::IntField("roles", static_cast<int64_t>(catalog->Roles().size())),
                                          observability::IntField("exclusion_groups", static_cast<int64_t>(catalog->Groups().size()))});
  return catalog;
}

std::optional<RoleRecord> RoleCatalog::Find(const std::string& name) const {
  if (auto it = by_code_.find(name); it != by_code_.end()) return roles_[it->second];
  if (auto it = by_display_name_.find(name); it != by_display_name_.end()) return roles_[it->second];
  return std::nullopt;
}

std::optional<RoleRecord> RoleCatalog::FindById(int64_t role_id) const {
  auto it = by_id_.find(role_id);
  if (it == by_id_.end()) return std::nullopt;
  return roles_[it->second];
}

std::vector<const ExclusionGroupRecord*> RoleCatalog::GroupsContaining(int64_t role_id) const {
  std::vector<const ExclusionGroupRecord*> out;
  auto it = groups_by_role_.find(role_id);
  if (it == groups_by_role_.end()) return out;
  for (auto g : it->second) out.push_back(&groups_[g]);
  return out;
}

std::optional<Conflict> RoleCatalog::FindConflict(int64_t role_id, const std::vector<int64_t>& held_role_ids) const {
  for (const auto* group : GroupsContaining(role_id)) {
    for (auto held : held_role_ids) {
      if (held == role_id) continue;
      if (std::binary_search(group->role_ids.begin(), group->role_ids.end(), held)) {
        return Conflict{group->name, roles_[by_id_.at(held)]};
      }
    }
  }
  return std::nullopt;
}

void SeedCatalog(db::Repository& repository, const roster::runtime::config::CatalogConfig& config) {
  auto tx = repository.Begin();

  std::unordered_map<std::string, int64_t> ids;
  for (const auto& role_config : config.roles()) {
    RoleRecord role;
    role.code         = role_config.code();
    role.display_name = role_config.display_name().empty() ? role_config.code() : role_config.display_name();
    role.is_unique    = role_config.unique();
    role.sort_order   = role_config.sort_order();

    if (role.code.empty()) {
      throw util::InvalidCatalog("catalog role without a code");
    }
    if (auto r = repository.UpsertRole(*tx, role); !r) {
      throw util::InvalidCatalog("cannot seed role " + role.code + ": " + r.message);
    }
    ids[role.code] = role.id;
  }

  for (const auto& group_config : config.exclusion_groups()) {
    ExclusionGroupRecord group;
    group.name = group_config.name();
    for (const auto& code : group_config.roles()) {
      auto it = ids.find(code);
      if (it == ids.end()) {
        // not in this config; may be a role seeded earlier
        auto existing = repository.GetRole(*tx, code);
        if (!existing) {
          throw util::InvalidCatalog("exclusion group " + group.name + " references unknown role " + code);
        }
        it = ids.emplace(code, existing->id).first;
      }
      group.role_ids.push_back(it->second);
    }
    if (auto r = repository.ReplaceExclusionGroup(*tx, group); !r) {
      throw util::InvalidCatalog("cannot seed exclusion group " + group.name + ": " + r.message);
    }
  }

  tx->Commit();
}

} // namespace roster::catalog
