#include "roster_service.hpp"

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/catalog/role_catalog.hpp"
#include "internal/core/assignment_engine.hpp"
#include "internal/directory/directory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/projection/roster_projector.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace roster::service {

using namespace roster::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    auto result = fn();
    ROSTER_LOG_DEBUG("RPC completed", {roster::observability::StringField("route", route), roster::observability::IntField("elapsed_ms", elapsed_ms())});
    return result;
  } catch (const std::exception& ex) {
    ROSTER_LOG_WARN("RPC failed", {roster::observability::StringField("route", route), roster::observability::StringField("error", ex.what()),
                                   roster::observability::IntField("elapsed_ms", elapsed_ms())});
    throw;
  }
}

User ToProto(const db::model::UserRecord& record) {
  User user;
  user.set_user_id(record.id);
  user.set_first_name(record.first_name);
  user.set_last_name(record.last_name);
  user.set_full_name(record.full_name);
  user.set_handle(record.handle);
  return user;
}

Location ToProto(const db::model::LocationRecord& record) {
  Location location;
  location.set_location_id(record.id);
  location.set_name(record.name);
  return location;
}

Event ToProto(const db::model::EventRecord& record) {
  Event event;
  event.set_event_id(record.id);
  event.set_location_id(record.location_id);
  event.set_event_date(record.event_date);
  return event;
}

Role ToProto(const db::model::RoleRecord& record) {
  Role role;
  role.set_code(record.code);
  role.set_display_name(record.display_name);
  role.set_unique(record.is_unique);
  role.set_sort_order(record.sort_order);
  return role;
}

roster::v1::DeclineReason ToProto(core::DeclineReason reason) {
  switch (reason) {
    case core::DeclineReason::kRoleNotFound:
      return DECLINE_REASON_ROLE_NOT_FOUND;
    case core::DeclineReason::kAlreadyAssignedSameRole:
      return DECLINE_REASON_ALREADY_ASSIGNED_SAME_ROLE;
    case core::DeclineReason::kRoleTaken:
      return DECLINE_REASON_ROLE_TAKEN;
    case core::DeclineReason::kExclusionConflict:
      return DECLINE_REASON_EXCLUSION_CONFLICT;
    case core::DeclineReason::kNone:
      break;
  }
  return DECLINE_REASON_UNSPECIFIED;
}

void RequireId(int64_t id, const char* what) {
  if (id <= 0) {
    throw roster::util::InvalidArgument(std::string(what) + " must be positive");
  }
}

} // namespace

RosterService::RosterService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterUserResponse RosterService::RegisterUser(const RegisterUserRequest& req) {
  return ObserveRpc("RosterService.RegisterUser", [&] {
    RequireId(req.user().user_id(), "user_id");

    db::model::UserRecord profile;
    profile.id         = req.user().user_id();
    profile.first_name = req.user().first_name();
    profile.last_name  = req.user().last_name();
    profile.full_name  = req.user().full_name();
    profile.handle     = req.user().handle();

    auto resolved = ctx_.directory->RegisterUser(profile);

    RegisterUserResponse resp;
    *resp.mutable_user() = ToProto(resolved.record);
    resp.set_created(resolved.created);
    return resp;
  });
}

ListLocationsResponse RosterService::ListLocations(const ListLocationsRequest&) {
  return ObserveRpc("RosterService.ListLocations", [&] {
    ListLocationsResponse resp;
    for (const auto& location : ctx_.directory->ListActiveLocations()) {
      *resp.add_locations() = ToProto(location);
    }
    return resp;
  });
}

ListRolesResponse RosterService::ListRoles(const ListRolesRequest&) {
  return ObserveRpc("RosterService.ListRoles", [&] {
    ListRolesResponse resp;
    for (const auto& role : ctx_.catalog->Roles()) {
      *resp.add_roles() = ToProto(role);
    }
    return resp;
  });
}

OpenEventResponse RosterService::OpenEvent(const OpenEventRequest& req) {
  return ObserveRpc("RosterService.OpenEvent", [&] {
    if (req.location_name().empty()) {
      throw roster::util::InvalidArgument("location_name is required");
    }

    auto location = ctx_.directory->FindActiveLocation(req.location_name());
    if (!location) {
      throw roster::util::NotFound("location '" + req.location_name() + "' is not an active location");
    }

    const auto date     = req.event_date().empty() ? ctx_.directory->NextEventDate(roster::util::Now()) : req.event_date();
    auto       resolved = ctx_.directory->OpenEvent(location->id, date);

    OpenEventResponse resp;
    *resp.mutable_event()    = ToProto(resolved.record);
    *resp.mutable_location() = ToProto(*location);
    resp.set_created(resolved.created);
    return resp;
  });
}

AssignResponse RosterService::Assign(const AssignRequest& req) {
  return ObserveRpc("RosterService.Assign", [&] {
    RequireId(req.user_id(), "user_id");
    RequireId(req.event_id(), "event_id");
    if (req.role_name().empty()) {
      throw roster::util::InvalidArgument("role_name is required");
    }

    auto result = ctx_.engine->Assign(core::AssignRequest{req.user_id(), req.event_id(), req.role_name()});

    AssignResponse resp;
    resp.set_ok(result.ok);
    resp.set_reason(ToProto(result.reason));
    resp.set_role_name(result.role_name);
    resp.set_conflicting_role_name(result.conflicting_role_name);
    resp.set_exclusion_group(result.exclusion_group);
    for (const auto& replaced : result.replaced_roles) resp.add_replaced_roles(replaced);
    resp.set_message(result.Describe());
    return resp;
  });
}

UnassignResponse RosterService::Unassign(const UnassignRequest& req) {
  return ObserveRpc("RosterService.Unassign", [&] {
    RequireId(req.user_id(), "user_id");
    RequireId(req.event_id(), "event_id");

    auto result = ctx_.engine->Unassign(req.user_id(), req.event_id());

    UnassignResponse resp;
    resp.set_removed(result.removed);
    resp.set_removed_count(result.removed_count);
    return resp;
  });
}

GetRosterResponse RosterService::GetRoster(const GetRosterRequest& req) {
  return ObserveRpc("RosterService.GetRoster", [&] {
    RequireId(req.event_id(), "event_id");

    auto event = ctx_.directory->GetEvent(req.event_id());
    if (!event) {
      throw roster::util::NotFound("event " + std::to_string(req.event_id()) + " does not exist");
    }

    GetRosterResponse resp;
    *resp.mutable_event() = ToProto(*event);
    for (const auto& entry : ctx_.projector->Project(req.event_id())) {
      auto* out           = resp.add_entries();
      *out->mutable_role() = ToProto(entry.role);
      out->set_assignee_user_id(entry.assignee_user_id.value_or(0));
      out->set_assignee_name(entry.assignee_name);
      out->set_assignee_handle(entry.assignee_handle);
    }
    return resp;
  });
}

} // namespace roster::service
