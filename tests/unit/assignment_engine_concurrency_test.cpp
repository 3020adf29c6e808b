#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/assignment_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "roster_fixture.hpp"
#if ROSTER_DB_SQLITE
#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using roster::core::AssignmentEngine;
using roster::core::AssignRequest;
using roster::core::AssignResult;
using roster::core::DeclineReason;

constexpr int kContenders = 50;

struct Tally {
  std::atomic<int> ok{0};
  std::atomic<int> taken{0};
  std::atomic<int> other{0};
};

// Releases every thread at once, then joins them.
void RunTogether(int count, const std::function<void(int)>& body) {
  std::atomic<bool>        go{false};
  std::vector<std::thread> threads;
  threads.reserve(count);
  for (int i = 0; i < count; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) std::this_thread::yield();
      body(i);
    });
  }
  go = true;
  for (auto& t : threads) t.join();
}

void Count(const AssignResult& result, Tally& tally) {
  if (result.ok) {
    ++tally.ok;
  } else if (result.reason == DeclineReason::kRoleTaken) {
    ++tally.taken;
  } else {
    ++tally.other;
  }
}

std::size_t RowsFor(roster::testing::Fixture& fx, const std::string& code) {
  const auto  role_id = fx.catalog->Find(code)->id;
  auto        tx      = fx.repository->Begin();
  std::size_t count   = 0;
  for (const auto& row : fx.repository->ListEventAssignees(*tx, fx.event_id)) {
    if (row.role_id == role_id) ++count;
  }
  tx->Rollback();
  return count;
}

void CheckUniqueRoleRace(roster::testing::Fixture fx) {
  AssignmentEngine engine(fx.repository, fx.catalog);
  Tally            tally;

  RunTogether(kContenders, [&](int i) { Count(engine.Assign(AssignRequest{1000 + i, fx.event_id, "coordinator"}), tally); });

  assert(tally.ok == 1);
  assert(tally.taken == kContenders - 1);
  assert(tally.other == 0);
  assert(RowsFor(fx, "coordinator") == 1);
}

// Two engines model two server processes: no shared event lock, only the store.
void CheckUniqueRoleRaceAcrossEngines(roster::testing::Fixture fx) {
  AssignmentEngine first(fx.repository, fx.catalog);
  AssignmentEngine second(fx.repository, fx.catalog);
  Tally            tally;

  RunTogether(kContenders, [&](int i) {
    auto& engine = i % 2 == 0 ? first : second;
    Count(engine.Assign(AssignRequest{2000 + i, fx.event_id, "timekeeper"}), tally);
  });

  assert(tally.ok == 1);
  assert(tally.taken == kContenders - 1);
  assert(tally.other == 0);
  assert(RowsFor(fx, "timekeeper") == 1);
}

void CheckExclusionRaceForOneUser(roster::testing::Fixture fx) {
  AssignmentEngine engine(fx.repository, fx.catalog);
  const int64_t    user = 7;

  std::atomic<int> ok{0};
  std::atomic<int> conflicts{0};
  std::atomic<int> duplicates{0};

  // timekeeper and backup_timer share the timing group
  RunTogether(20, [&](int i) {
    auto result = engine.Assign(AssignRequest{user, fx.event_id, i % 2 == 0 ? "timekeeper" : "backup_timer"});
    if (result.ok) {
      ++ok;
    } else if (result.reason == DeclineReason::kExclusionConflict) {
      ++conflicts;
    } else if (result.reason == DeclineReason::kAlreadyAssignedSameRole) {
      ++duplicates;
    }
  });

  assert(ok == 1);
  assert(conflicts + duplicates == 19);
  assert(conflicts == 10);

  auto tx = fx.repository->Begin();
  assert(fx.repository->RolesHeldBy(*tx, user, fx.event_id).size() == 1);
  tx->Rollback();
}

void CheckIndependentEventsProceed(roster::testing::Fixture fx) {
  AssignmentEngine engine(fx.repository, fx.catalog);

  std::vector<int64_t> events;
  for (int day = 0; day < 8; ++day) {
    events.push_back(roster::testing::CreateEvent(*fx.repository, fx.location_id, "2027-01-0" + std::to_string(day + 1)));
  }

  std::atomic<int> ok{0};
  RunTogether(static_cast<int>(events.size()), [&](int i) {
    if (engine.Assign(AssignRequest{1, events[i], "coordinator"}).ok) ++ok;
  });
  assert(ok == static_cast<int>(events.size()));
}

void TestMemoryBackend() {
  using roster::db::memory::MemoryRepository;
  CheckUniqueRoleRace(roster::testing::MakeFixture(std::make_shared<MemoryRepository>()));
  CheckUniqueRoleRaceAcrossEngines(roster::testing::MakeFixture(std::make_shared<MemoryRepository>()));
  CheckExclusionRaceForOneUser(roster::testing::MakeFixture(std::make_shared<MemoryRepository>()));
  CheckIndependentEventsProceed(roster::testing::MakeFixture(std::make_shared<MemoryRepository>()));
}

#if ROSTER_DB_SQLITE
std::shared_ptr<roster::db::Repository> OpenSqlite(const std::filesystem::path& path) {
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");

  auto db = std::make_shared<roster::db::sqlite::SqliteDB>(path.string());
  for (const auto& sql : roster::db::sql::SqliteSchema()) db->Exec(sql);
  return std::make_shared<roster::db::sqlite::SqliteRepository>(std::move(db));
}

void TestSqliteBackend() {
  const auto dir = std::filesystem::temp_directory_path() / "roster_engine_concurrency";
  std::filesystem::create_directories(dir);

  CheckUniqueRoleRace(roster::testing::MakeFixture(OpenSqlite(dir / "unique.db")));
  CheckUniqueRoleRaceAcrossEngines(roster::testing::MakeFixture(OpenSqlite(dir / "engines.db")));
  CheckExclusionRaceForOneUser(roster::testing::MakeFixture(OpenSqlite(dir / "exclusion.db")));

  std::filesystem::remove_all(dir);
}
#endif

} // namespace

int main() {
  TestMemoryBackend();
#if ROSTER_DB_SQLITE
  TestSqliteBackend();
#endif

  std::cout << "roster_unit_assignment_engine_concurrency: pass\n";
  return 0;
}
