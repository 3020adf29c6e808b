#pragma once

#include "roster/v1.hpp"
#include "service_context.hpp"

namespace roster::service {

/*
  Protobuf facade over Directory, AssignmentEngine and RosterProjector.

  Assignment declines are response values. Malformed requests throw
  util::InvalidArgument, unknown locations and events util::NotFound,
  store failures util::StoreUnavailable.
*/
class RosterService {
public:
  explicit RosterService(ServiceContext ctx);

  roster::v1::RegisterUserResponse
  RegisterUser(const roster::v1::RegisterUserRequest& req);

  roster::v1::ListLocationsResponse
  ListLocations(const roster::v1::ListLocationsRequest& req);

  roster::v1::ListRolesResponse
  ListRoles(const roster::v1::ListRolesRequest& req);

  roster::v1::OpenEventResponse
  OpenEvent(const roster::v1::OpenEventRequest& req);

  roster::v1::AssignResponse
  Assign(const roster::v1::AssignRequest& req);

  roster::v1::UnassignResponse
  Unassign(const roster::v1::UnassignRequest& req);

  roster::v1::GetRosterResponse
  GetRoster(const roster::v1::GetRosterRequest& req);

private:
  ServiceContext ctx_;
};

}
