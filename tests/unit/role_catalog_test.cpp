#include "internal/catalog/role_catalog.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "roster_fixture.hpp"

namespace {

using roster::catalog::RoleCatalog;
using roster::db::model::ExclusionGroupRecord;
using roster::db::model::RoleRecord;
using roster::util::InvalidCatalog;

RoleRecord Role(int64_t id, const std::string& code, const std::string& display, bool unique = false, int32_t sort = 0) {
  RoleRecord role;
  role.id           = id;
  role.code         = code;
  role.display_name = display;
  role.is_unique    = unique;
  role.sort_order   = sort;
  return role;
}

template <typename Fn>
bool ThrowsInvalidCatalog(Fn&& fn) {
  try {
    fn();
  } catch (const InvalidCatalog&) {
    return true;
  }
  return false;
}

void TestRolesAreKeptInDisplayOrder() {
  RoleCatalog catalog({Role(3, "c", "C", false, 5), Role(1, "a", "A", false, 10), Role(2, "b", "B", false, 5)}, {});

  const auto& roles = catalog.Roles();
  assert(roles.size() == 3);
  assert(roles[0].id == 2);
  assert(roles[1].id == 3);
  assert(roles[2].id == 1);
}

void TestFindPrefersCodeOverDisplayName() {
  // role 2's display name equals role 1's code
  RoleCatalog catalog({Role(1, "marshal", "Marshal"), Role(2, "lead", "marshal")}, {});

  auto by_code = catalog.Find("marshal");
  assert(by_code.has_value());
  assert(by_code->id == 1);

  auto by_display = catalog.Find("Marshal");
  assert(by_display.has_value());
  assert(by_display->id == 1);

  assert(!catalog.Find("nobody").has_value());
  assert(catalog.FindById(2)->code == "lead");
  assert(!catalog.FindById(99).has_value());
}

void TestValidationRejectsBrokenCatalogues() {
  assert(ThrowsInvalidCatalog([] { RoleCatalog({Role(1, "a", "A"), Role(2, "a", "B")}, {}); }));
  assert(ThrowsInvalidCatalog([] { RoleCatalog({Role(1, "a", "A"), Role(2, "b", "A")}, {}); }));
  assert(ThrowsInvalidCatalog([] { RoleCatalog({Role(1, "", "A")}, {}); }));
  assert(ThrowsInvalidCatalog([] { RoleCatalog({Role(1, "a", "A"), Role(2, "b", "B")}, {ExclusionGroupRecord{"pair", {1, 1}}}); }));
  assert(ThrowsInvalidCatalog([] { RoleCatalog({Role(1, "a", "A"), Role(2, "b", "B")}, {ExclusionGroupRecord{"pair", {1, 7}}}); }));
  assert(ThrowsInvalidCatalog(
      [] { RoleCatalog({Role(1, "a", "A"), Role(2, "b", "B")}, {ExclusionGroupRecord{"g", {1, 2}}, ExclusionGroupRecord{"g", {1, 2}}}); }));
}

void TestOverlappingGroupsAndConflicts() {
  RoleCatalog catalog({Role(1, "timekeeper", "Timekeeper"), Role(2, "backup", "Backup"), Role(3, "photo", "Photo"), Role(4, "marshal", "Marshal")},
                      {ExclusionGroupRecord{"timing", {1, 2}}, ExclusionGroupRecord{"media", {3, 2}}});

  assert(catalog.GroupsContaining(2).size() == 2);
  assert(catalog.GroupsContaining(1).size() == 1);
  assert(catalog.GroupsContaining(4).empty());

  auto conflict = catalog.FindConflict(2, {4, 3});
  assert(conflict.has_value());
  assert(conflict->group == "media");
  assert(conflict->role.id == 3);

  // a role never conflicts with itself or with roles outside its groups
  assert(!catalog.FindConflict(2, {2, 4}).has_value());
  assert(!catalog.FindConflict(4, {1, 2, 3}).has_value());
  assert(!catalog.FindConflict(1, {3}).has_value());
}

void TestSeedThenLoadRoundTripsThroughTheStore() {
  auto repo = std::make_shared<roster::db::memory::MemoryRepository>();
  roster::catalog::SeedCatalog(*repo, roster::testing::DefaultCatalog());
  // seeding twice updates in place
  roster::catalog::SeedCatalog(*repo, roster::testing::DefaultCatalog());

  auto catalog = RoleCatalog::Load(*repo);
  assert(catalog->Roles().size() == 5);
  assert(catalog->Roles().front().code == "coordinator");
  assert(catalog->Roles().front().is_unique);
  assert(catalog->Groups().size() == 2);

  auto backup = catalog->Find("Backup Timer");
  assert(backup.has_value());
  assert(catalog->GroupsContaining(backup->id).size() == 2);
}

void TestSeedRejectsGroupWithUnknownRole() {
  auto repo   = std::make_shared<roster::db::memory::MemoryRepository>();
  auto config = roster::testing::DefaultCatalog();
  auto* group = config.add_exclusion_groups();
  group->set_name("ghosts");
  group->add_roles("marshal");
  group->add_roles("ghost");

  assert(ThrowsInvalidCatalog([&] { roster::catalog::SeedCatalog(*repo, config); }));

  // nothing from the failed seed was committed
  auto tx = repo->Begin();
  assert(repo->ListRoles(*tx).empty());
}

} // namespace

int main() {
  TestRolesAreKeptInDisplayOrder();
  TestFindPrefersCodeOverDisplayName();
  TestValidationRejectsBrokenCatalogues();
  TestOverlappingGroupsAndConflicts();
  TestSeedThenLoadRoundTripsThroughTheStore();
  TestSeedRejectsGroupWithUnknownRole();

  std::cout << "roster_unit_role_catalog: pass\n";
  return 0;
}
