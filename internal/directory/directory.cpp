#include "internal/directory/directory.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace roster::directory {

using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result) {
  if (!result) throw db::DbError(result);
}

// Runs fn; store errors become StoreUnavailable after logging.
template <typename Fn>
auto Guarded(const char* operation, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const db::DbError& e) {
    ROSTER_LOG_ERROR("directory store failure",
                     {StringField("operation", operation), StringField("code", db::ToString(e.code())), StringField("error", e.what())});
    throw util::StoreUnavailable(std::string(operation) + ": " + e.what());
  }
}

std::string JoinName(const std::string& first, const std::string& last) {
  if (first.empty()) return last;
  if (last.empty()) return first;
  return first + " " + last;
}

} // namespace

Directory::Directory(std::shared_ptr<db::Repository> repository, DirectoryOptions options)
    : repository_(std::move(repository)), options_(options) {
}

Resolved<db::model::UserRecord> Directory::RegisterUser(const db::model::UserRecord& profile) {
  if (profile.id == 0) {
    throw util::InvalidArgument("user id is required");
  }

  return Guarded("register_user", [&] {
    {
      auto tx = repository_->Begin();
      if (auto existing = repository_->GetUser(*tx, profile.id)) {
        tx->Rollback();
        return Resolved<db::model::UserRecord>{*existing, false};
      }

      auto user = profile;
      if (user.full_name.empty()) user.full_name = JoinName(user.first_name, user.last_name);

      bool inserted = false;
      ThrowIfDbError(repository_->InsertUser(*tx, user, inserted));
      if (inserted) {
        try {
          tx->Commit();
          ROSTER_LOG_INFO("user registered", {IntField("user_id", user.id), StringField("name", user.full_name)});
          return Resolved<db::model::UserRecord>{user, true};
        } catch (const db::DbError& e) {
          if (e.code() != db::ErrorCode::ConstraintViolation) throw;
        }
      }
    }

    // a concurrent registration won; its profile stands
    auto tx     = repository_->Begin();
    auto winner = repository_->GetUser(*tx, profile.id);
    tx->Commit();
    if (!winner) {
      throw db::DbError(db::ErrorCode::InternalError, "user " + std::to_string(profile.id) + " vanished after registration");
    }
    return Resolved<db::model::UserRecord>{*winner, false};
  });
}

std::vector<db::model::LocationRecord> Directory::ListActiveLocations() {
  return Guarded("list_locations", [&] {
    auto tx        = repository_->Begin();
    auto locations = repository_->ListLocations(*tx, true);
    tx->Commit();
    return locations;
  });
}

std::optional<db::model::LocationRecord> Directory::FindActiveLocation(const std::string& name) {
  return Guarded("find_location", [&] {
    auto tx       = repository_->Begin();
    auto location = repository_->FindLocationByName(*tx, name);
    tx->Commit();
    if (location && !location->active) return std::optional<db::model::LocationRecord>{};
    return location;
  });
}

Resolved<db::model::EventRecord> Directory::OpenEvent(int64_t location_id, const std::string& event_date) {
  if (!util::IsIsoDate(event_date)) {
    throw util::InvalidArgument("event date must be YYYY-MM-DD: '" + event_date + "'");
  }

  return Guarded("open_event", [&] {
    {
      auto tx = repository_->Begin();
      if (auto existing = repository_->FindEvent(*tx, location_id, event_date)) {
        tx->Rollback();
        return Resolved<db::model::EventRecord>{*existing, false};
      }

      db::model::EventRecord event;
      event.location_id   = location_id;
      event.event_date    = event_date;
      event.created_at_ms = util::ToUnixMillis(util::Now());

      auto created = repository_->CreateEvent(*tx, event);
      if (created) {
        try {
          tx->Commit();
          ROSTER_LOG_INFO("event created", {IntField("event_id", event.id), IntField("location_id", location_id), StringField("date", event_date)});
          return Resolved<db::model::EventRecord>{event, true};
        } catch (const db::DbError& e) {
          if (e.code() != db::ErrorCode::ConstraintViolation) throw;
        }
      } else if (created.code != db::ErrorCode::ConstraintViolation) {
        throw db::DbError(created);
      }
    }

    // lost the race (or the location id is unknown)
    auto tx     = repository_->Begin();
    auto winner = repository_->FindEvent(*tx, location_id, event_date);
    tx->Commit();
    if (!winner) {
      throw util::NotFound("location " + std::to_string(location_id) + " does not exist");
    }
    return Resolved<db::model::EventRecord>{*winner, false};
  });
}

std::optional<db::model::EventRecord> Directory::GetEvent(int64_t event_id) {
  return Guarded("get_event", [&] {
    auto tx    = repository_->Begin();
    auto event = repository_->GetEvent(*tx, event_id);
    tx->Commit();
    return event;
  });
}

std::string Directory::NextEventDate(util::TimePoint now) const {
  return util::FormatIsoDate(util::NextWeekdayDate(util::LocalDate(now), options_.event_weekday));
}

void SeedLocations(db::Repository& repository, const google::protobuf::RepeatedPtrField<roster::runtime::config::LocationConfig>& locations) {
  auto tx = repository.Begin();
  for (const auto& config : locations) {
    if (config.name().empty()) {
      throw util::InvalidArgument("location without a name");
    }
    db::model::LocationRecord location;
    location.name   = config.name();
    location.active = config.has_active() ? config.active() : true;
    ThrowIfDbError(repository.UpsertLocation(*tx, location));
  }
  tx->Commit();
}

} // namespace roster::directory
