#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/assignment_engine.hpp"
#include "internal/catalog/role_catalog.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/projection/roster_projector.hpp"

#if ROSTER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if ROSTER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using roster::db::ErrorCode;
using roster::db::Repository;
using roster::db::memory::MemoryRepository;
using roster::db::model::AssignmentRecord;
using roster::db::model::EventRecord;
using roster::db::model::ExclusionGroupRecord;
using roster::db::model::LocationRecord;
using roster::db::model::RoleRecord;
using roster::db::model::UserRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

// Names made unique per run so a persistent database can be reused.
struct Names {
  std::string suffix;

  std::string operator()(const std::string& base) const {
    return base + "-" + suffix;
  }
};

RoleRecord Role(const std::string& code, const std::string& display, bool unique, int32_t sort) {
  RoleRecord role;
  role.code         = code;
  role.display_name = display;
  role.is_unique    = unique;
  role.sort_order   = sort;
  return role;
}

AssignmentRecord Assignment(int64_t user, const RoleRecord& role, int64_t event, uint64_t at_ms) {
  AssignmentRecord record;
  record.user_id       = user;
  record.role_id       = role.id;
  record.event_id      = event;
  record.unique_role   = role.is_unique;
  record.created_at_ms = at_ms;
  return record;
}

struct Seeded {
  RoleRecord lead;
  RoleRecord timer;
  RoleRecord helper;
  int64_t    location_id = 0;
  int64_t    event_id    = 0;
};

Seeded Seed(Repository& repo, const Names& names) {
  Seeded seeded;
  auto   tx = repo.Begin();

  seeded.lead   = Role(names("lead"), names("Lead"), true, 10);
  seeded.timer  = Role(names("timer"), names("Timer"), false, 20);
  seeded.helper = Role(names("helper"), names("Helper"), false, 30);
  assert(repo.UpsertRole(*tx, seeded.lead));
  assert(repo.UpsertRole(*tx, seeded.timer));
  assert(repo.UpsertRole(*tx, seeded.helper));

  LocationRecord location;
  location.name = names("Angarka");
  assert(repo.UpsertLocation(*tx, location));
  seeded.location_id = location.id;

  EventRecord event;
  event.location_id = location.id;
  event.event_date  = "2026-10-24";
  assert(repo.CreateEvent(*tx, event));
  seeded.event_id = event.id;

  tx->Commit();
  return seeded;
}

void VerifyCatalogueReadWrite(Repository& repo, const Names& names) {
  auto seeded = Seed(repo, names);

  {
    auto tx = repo.Begin();

    // upsert by code keeps the id
    auto again         = Role(names("lead"), names("Lead Person"), true, 5);
    assert(repo.UpsertRole(*tx, again));
    assert(again.id == seeded.lead.id);

    auto by_code = repo.GetRole(*tx, names("lead"));
    assert(by_code.has_value());
    assert(by_code->display_name == names("Lead Person"));
    assert(by_code->is_unique);

    auto by_display = repo.GetRole(*tx, names("Timer"));
    assert(by_display.has_value());
    assert(by_display->id == seeded.timer.id);

    assert(!repo.GetRole(*tx, names("nobody")).has_value());

    ExclusionGroupRecord group;
    group.name     = names("pair");
    group.role_ids = {seeded.timer.id, seeded.helper.id};
    assert(repo.ReplaceExclusionGroup(*tx, group));

    group.role_ids = {seeded.lead.id, seeded.timer.id};
    assert(repo.ReplaceExclusionGroup(*tx, group));
    tx->Commit();
  }

  auto tx = repo.Begin();
  bool found = false;
  for (const auto& group : repo.ListExclusionGroups(*tx)) {
    if (group.name != names("pair")) continue;
    found = true;
    assert(group.role_ids.size() == 2);
    assert(group.role_ids[0] == std::min(seeded.lead.id, seeded.timer.id));
    assert(group.role_ids[1] == std::max(seeded.lead.id, seeded.timer.id));
  }
  assert(found);

  // display order is sort_order, then id
  std::vector<int64_t> ours;
  for (const auto& role : repo.ListRoles(*tx)) {
    if (role.id == seeded.lead.id || role.id == seeded.timer.id || role.id == seeded.helper.id) ours.push_back(role.id);
  }
  assert((ours == std::vector<int64_t>{seeded.lead.id, seeded.timer.id, seeded.helper.id}));
  tx->Commit();
}

void VerifyAssignmentConstraints(Repository& repo, const Names& names) {
  auto seeded = Seed(repo, names);

  {
    auto tx = repo.Begin();
    assert(repo.LockEvent(*tx, seeded.event_id));
    assert(repo.InsertAssignment(*tx, Assignment(1, seeded.lead, seeded.event_id, 1000)));
    assert(repo.InsertAssignment(*tx, Assignment(1, seeded.helper, seeded.event_id, 2000)));
    assert(repo.InsertAssignment(*tx, Assignment(2, seeded.helper, seeded.event_id, 3000)));
    tx->Commit();
  }

  // same triple
  {
    auto tx = repo.Begin();
    auto r  = repo.InsertAssignment(*tx, Assignment(1, seeded.helper, seeded.event_id, 4000));
    assert(!r);
    assert(r.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  // second holder of a unique role
  {
    auto tx = repo.Begin();
    auto r  = repo.InsertAssignment(*tx, Assignment(2, seeded.lead, seeded.event_id, 4000));
    assert(!r);
    assert(r.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(repo.HasAssignment(*tx, 1, seeded.lead.id, seeded.event_id));
  assert(!repo.HasAssignment(*tx, 2, seeded.lead.id, seeded.event_id));
  assert(repo.IsRoleTaken(*tx, seeded.lead.id, seeded.event_id));
  assert(!repo.IsRoleTaken(*tx, seeded.timer.id, seeded.event_id));

  auto held = repo.RolesHeldBy(*tx, 1, seeded.event_id);
  assert(held.size() == 2);
  assert(held[0].id == seeded.lead.id);
  assert(held[1].id == seeded.helper.id);

  auto rows = repo.ListEventAssignees(*tx, seeded.event_id);
  assert(rows.size() == 3);
  assert(rows[0].created_at_ms == 1000);
  assert(rows[2].user_id == 2);

  uint64_t removed = 0;
  assert(repo.DeleteAssignments(*tx, 1, seeded.event_id, removed));
  assert(removed == 2);
  assert(!repo.IsRoleTaken(*tx, seeded.lead.id, seeded.event_id));
  tx->Commit();
}

void VerifyDirectoryReadWrite(Repository& repo, const Names& names) {
  auto seeded = Seed(repo, names);

  {
    auto       tx = repo.Begin();
    UserRecord user;
    user.id        = 900000 + static_cast<int64_t>(NowMs() % 100000);
    user.full_name = "Ada Lovelace";
    user.handle    = "ada";
    bool inserted = false;
    assert(repo.InsertUser(*tx, user, inserted));
    assert(inserted);

    // a second registration never overwrites the profile
    auto changed   = user;
    changed.handle = "countess";
    assert(repo.InsertUser(*tx, changed, inserted));
    assert(!inserted);

    auto fetched = repo.GetUser(*tx, user.id);
    assert(fetched.has_value());
    assert(fetched->handle == "ada");

    assert(repo.InsertAssignment(*tx, Assignment(user.id, seeded.timer, seeded.event_id, 1000)));
    auto rows = repo.ListEventAssignees(*tx, seeded.event_id);
    assert(rows.size() == 1);
    assert(rows[0].full_name == "Ada Lovelace");
    tx->Commit();
  }

  {
    auto           tx = repo.Begin();
    LocationRecord closed;
    closed.name   = names("Old Park");
    closed.active = false;
    assert(repo.UpsertLocation(*tx, closed));

    auto found = repo.FindLocationByName(*tx, names("Old Park"));
    assert(found.has_value());
    assert(!found->active);

    bool listed_closed = false;
    for (const auto& location : repo.ListLocations(*tx, true)) {
      if (location.id == closed.id) listed_closed = true;
    }
    assert(!listed_closed);

    bool listed_all = false;
    for (const auto& location : repo.ListLocations(*tx, false)) {
      if (location.id == closed.id) listed_all = true;
    }
    assert(listed_all);
    tx->Commit();
  }

  {
    auto        tx = repo.Begin();
    EventRecord duplicate;
    duplicate.location_id = seeded.location_id;
    duplicate.event_date  = "2026-10-24";
    auto r                = repo.CreateEvent(*tx, duplicate);
    assert(!r);
    assert(r.code == ErrorCode::ConstraintViolation);
    tx->Rollback();
  }

  auto tx    = repo.Begin();
  auto found = repo.FindEvent(*tx, seeded.location_id, "2026-10-24");
  assert(found.has_value());
  assert(found->id == seeded.event_id);
  assert(repo.GetEvent(*tx, seeded.event_id).has_value());
  assert(!repo.FindEvent(*tx, seeded.location_id, "2026-10-31").has_value());
  tx->Commit();

  auto lock_tx = repo.Begin();
  auto locked  = repo.LockEvent(*lock_tx, seeded.event_id + 1000000);
  assert(!locked);
  assert(locked.code == ErrorCode::NotFound);
  lock_tx->Rollback();
}

void VerifyRollbackBehavior(Repository& repo, const Names& names) {
  auto seeded = Seed(repo, names);
  {
    auto tx = repo.Begin();
    assert(repo.InsertAssignment(*tx, Assignment(1, seeded.lead, seeded.event_id, 1000)));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertAssignment(*tx, Assignment(2, seeded.lead, seeded.event_id, 1000)));
    // dropped without commit
  }

  // finished transactions still in scope must not hold back the next Begin
  auto committed = repo.Begin();
  committed->Commit();
  auto rolled_back = repo.Begin();
  rolled_back->Rollback();

  auto tx = repo.Begin();
  assert(!repo.IsRoleTaken(*tx, seeded.lead.id, seeded.event_id));
  tx->Commit();
  assert(committed->IsCommitted() && rolled_back->IsCommitted());
}

void VerifyParallelTransactions(Repository& repo, const Names& names, bool supports_parallel_transactions) {
  auto seeded = Seed(repo, names);

  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();
  assert(repo.InsertAssignment(*tx1, Assignment(1, seeded.timer, seeded.event_id, 1000)));

  // uncommitted rows are invisible elsewhere
  assert(!repo.HasAssignment(*tx2, 1, seeded.timer.id, seeded.event_id));
  tx1->Commit();
  tx2->Rollback();

  auto verify = repo.Begin();
  assert(repo.HasAssignment(*verify, 1, seeded.timer.id, seeded.event_id));
  verify->Commit();
}

void VerifyEngineOverBackend(const std::shared_ptr<Repository>& repo, const Names& names) {
  auto seeded = Seed(*repo, names);

  {
    auto                 tx = repo->Begin();
    ExclusionGroupRecord group;
    group.name     = names("engine-pair");
    group.role_ids = {seeded.timer.id, seeded.helper.id};
    assert(repo->ReplaceExclusionGroup(*tx, group));
    tx->Commit();
  }

  auto catalog = roster::catalog::RoleCatalog::Load(*repo);
  roster::core::AssignmentEngine      engine(repo, catalog);
  roster::projection::RosterProjector projector(repo, catalog);

  using roster::core::AssignRequest;
  using roster::core::DeclineReason;

  assert(engine.Assign(AssignRequest{1, seeded.event_id, names("lead")}).ok);
  assert(engine.Assign(AssignRequest{2, seeded.event_id, names("lead")}).reason == DeclineReason::kRoleTaken);
  assert(engine.Assign(AssignRequest{1, seeded.event_id, names("lead")}).reason == DeclineReason::kAlreadyAssignedSameRole);
  assert(engine.Assign(AssignRequest{2, seeded.event_id, names("Timer")}).ok);
  assert(engine.Assign(AssignRequest{2, seeded.event_id, names("helper")}).reason == DeclineReason::kExclusionConflict);
  assert(engine.Assign(AssignRequest{2, seeded.event_id, names("ghost")}).reason == DeclineReason::kRoleNotFound);

  std::size_t filled = 0;
  for (const auto& entry : projector.Project(seeded.event_id)) {
    if (entry.Filled()) ++filled;
  }
  assert(filled == 2);

  auto removed = engine.Unassign(2, seeded.event_id);
  assert(removed.removed_count == 1);
  assert(engine.Assign(AssignRequest{2, seeded.event_id, names("helper")}).ok);
}

void VerifyRestartDurability(BackendFactory& backend, const Names& names) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo   = backend.make_repository();
  auto seeded = Seed(*repo, names);
  {
    auto tx = repo->Begin();
    assert(repo->InsertAssignment(*tx, Assignment(5, seeded.lead, seeded.event_id, 1000)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->IsRoleTaken(*tx, seeded.lead.id, seeded.event_id));
  auto role = repo->GetRole(*tx, names("lead"));
  assert(role.has_value());
  assert(role->id == seeded.lead.id);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if ROSTER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("roster_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    // short wait so the parallel-transaction check fails fast
    auto db = std::make_shared<roster::db::sqlite::SqliteDB>(db_path, std::chrono::milliseconds(200));
    for (const auto& sql : roster::db::sql::SqliteSchema()) db->Exec(sql);
    return std::make_shared<roster::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .supports_parallel_transactions = false,
  };
}
#endif

#if ROSTER_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("ROSTER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("ROSTER_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() -> std::shared_ptr<Repository> {
    auto pool = std::make_shared<roster::db::postgres::PgPool>(conninfo);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      for (const auto& sql : roster::db::sql::PostgresSchema()) tx.exec(sql);
      tx.commit();
    }
    return std::make_shared<roster::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  const auto run = std::to_string(NowMs());
  auto       names = [&](const std::string& check) { return Names{check + "-" + run}; };

  // each check works on its own location, so events never collide
  VerifyCatalogueReadWrite(*repo, names("catalogue"));
  VerifyAssignmentConstraints(*repo, names("constraints"));
  VerifyDirectoryReadWrite(*repo, names("directory"));
  VerifyRollbackBehavior(*repo, names("rollback"));
  VerifyParallelTransactions(*repo, names("parallel"), backend.supports_parallel_transactions);
  VerifyEngineOverBackend(repo, names("engine"));

  repo.reset();
  VerifyRestartDurability(backend, names("durable"));

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if ROSTER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if ROSTER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "roster_integration_repository_parity: pass\n";
  return 0;
}
