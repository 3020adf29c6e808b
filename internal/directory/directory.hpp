#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace roster::directory {

template <typename T>
struct Resolved {
  T    record;
  bool created = false;
};

struct DirectoryOptions {
  std::chrono::weekday event_weekday = std::chrono::Saturday;
};

/*
  Directory

  Identity lookups the assignment calls depend on: users, active
  locations, and events keyed by (location, date).

  Store failures surface as util::StoreUnavailable.
*/
class Directory {
 public:
  explicit Directory(std::shared_ptr<db::Repository> repository, DirectoryOptions options = {});

  // Get-or-create by account id. An existing profile is never overwritten.
  Resolved<db::model::UserRecord> RegisterUser(const db::model::UserRecord& profile);

  // Ordered by name.
  std::vector<db::model::LocationRecord> ListActiveLocations();

  std::optional<db::model::LocationRecord> FindActiveLocation(const std::string& name);

  // Get-or-create by (location, date); event_date is YYYY-MM-DD. Losing a
  // concurrent create re-reads the winner's row.
  Resolved<db::model::EventRecord> OpenEvent(int64_t location_id, const std::string& event_date);

  std::optional<db::model::EventRecord> GetEvent(int64_t event_id);

  // Next configured weekday strictly after the local date of `now`.
  std::string NextEventDate(util::TimePoint now) const;

 private:
  std::shared_ptr<db::Repository> repository_;
  DirectoryOptions                options_;
};

// Upserts locations by name; an omitted active flag means active.
void SeedLocations(db::Repository& repository, const google::protobuf::RepeatedPtrField<roster::runtime::config::LocationConfig>& locations);

} // namespace roster::directory
