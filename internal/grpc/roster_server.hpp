#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "roster/v1/roster_service.grpc.pb.h"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/roster_service.hpp"

namespace roster::grpc {

class RosterServer final : public roster::v1::RosterService::Service {
public:
  explicit RosterServer(std::shared_ptr<roster::service::RosterService> svc);

  ::grpc::Status RegisterUser(::grpc::ServerContext*,
                              const roster::v1::RegisterUserRequest*,
                              roster::v1::RegisterUserResponse*) override;

  ::grpc::Status ListLocations(::grpc::ServerContext*,
                               const roster::v1::ListLocationsRequest*,
                               roster::v1::ListLocationsResponse*) override;

  ::grpc::Status ListRoles(::grpc::ServerContext*,
                           const roster::v1::ListRolesRequest*,
                           roster::v1::ListRolesResponse*) override;

  ::grpc::Status OpenEvent(::grpc::ServerContext*,
                           const roster::v1::OpenEventRequest*,
                           roster::v1::OpenEventResponse*) override;

  ::grpc::Status Assign(::grpc::ServerContext*,
                        const roster::v1::AssignRequest*,
                        roster::v1::AssignResponse*) override;

  ::grpc::Status Unassign(::grpc::ServerContext*,
                          const roster::v1::UnassignRequest*,
                          roster::v1::UnassignResponse*) override;

  ::grpc::Status GetRoster(::grpc::ServerContext*,
                           const roster::v1::GetRosterRequest*,
                           roster::v1::GetRosterResponse*) override;

private:
  // Runs call; exceptions become a status.
  template <typename Fn>
  static ::grpc::Status Handle(Fn&& call) {
    try {
      call();
      return ::grpc::Status::OK;
    } catch (const std::exception& e) {
      return ToStatus(e);
    }
  }

  std::shared_ptr<roster::service::RosterService> service_;
};

}
