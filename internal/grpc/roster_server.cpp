#include "roster_server.hpp"

namespace roster::grpc {

RosterServer::RosterServer(std::shared_ptr<roster::service::RosterService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RosterServer::RegisterUser(::grpc::ServerContext*,
                                          const roster::v1::RegisterUserRequest* req,
                                          roster::v1::RegisterUserResponse* resp) {
  return Handle([&] { *resp = service_->RegisterUser(*req); });
}

::grpc::Status RosterServer::ListLocations(::grpc::ServerContext*,
                                           const roster::v1::ListLocationsRequest* req,
                                           roster::v1::ListLocationsResponse* resp) {
  return Handle([&] { *resp = service_->ListLocations(*req); });
}

::grpc::Status RosterServer::ListRoles(::grpc::ServerContext*,
                                       const roster::v1::ListRolesRequest* req,
                                       roster::v1::ListRolesResponse* resp) {
  return Handle([&] { *resp = service_->ListRoles(*req); });
}

::grpc::Status RosterServer::OpenEvent(::grpc::ServerContext*,
                                       const roster::v1::OpenEventRequest* req,
                                       roster::v1::OpenEventResponse* resp) {
  return Handle([&] { *resp = service_->OpenEvent(*req); });
}

::grpc::Status RosterServer::Assign(::grpc::ServerContext*,
                                    const roster::v1::AssignRequest* req,
                                    roster::v1::AssignResponse* resp) {
  return Handle([&] { *resp = service_->Assign(*req); });
}

::grpc::Status RosterServer::Unassign(::grpc::ServerContext*,
                                      const roster::v1::UnassignRequest* req,
                                      roster::v1::UnassignResponse* resp) {
  return Handle([&] { *resp = service_->Unassign(*req); });
}

::grpc::Status RosterServer::GetRoster(::grpc::ServerContext*,
                                       const roster::v1::GetRosterRequest* req,
                                       roster::v1::GetRosterResponse* resp) {
  return Handle([&] { *resp = service_->GetRoster(*req); });
}

}
