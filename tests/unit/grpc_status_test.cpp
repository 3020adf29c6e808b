#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/roster_server.hpp"
#include "internal/util/errors.hpp"

namespace {

roster::factory::Application BuildApp() {
  return roster::factory::Build(roster::config::ConfigLoader::LoadFromYamlString(R"(catalog:
  roles:
    - { code: "coordinator", display_name: "Coordinator", unique: true, sort_order: 10 }
locations:
  - name: "Angarka"
)"));
}

void TestExceptionMapping() {
  using roster::grpc::ToStatus;

  assert(ToStatus(roster::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(roster::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(roster::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(roster::util::StoreUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(roster::util::InvalidCatalog("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);

  auto status = ToStatus(roster::util::NotFound("event 9 does not exist"));
  assert(status.error_message() == "event 9 does not exist");
}

void TestAssignToMissingEventReturnsNotFound() {
  auto                         app = BuildApp();
  roster::grpc::RosterServer   server(app.service);

  roster::v1::AssignRequest req;
  req.set_user_id(1);
  req.set_event_id(404);
  req.set_role_name("coordinator");
  roster::v1::AssignResponse resp;
  ::grpc::ServerContext      grpc_ctx;

  const auto status = server.Assign(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestDeclineIsAnOkStatus() {
  auto                       app = BuildApp();
  roster::grpc::RosterServer server(app.service);

  roster::v1::OpenEventRequest open;
  open.set_location_name("Angarka");
  open.set_event_date("2026-10-24");
  roster::v1::OpenEventResponse opened;
  ::grpc::ServerContext         open_ctx;
  assert(server.OpenEvent(&open_ctx, &open, &opened).ok());

  roster::v1::AssignRequest req;
  req.set_event_id(opened.event().event_id());
  req.set_role_name("coordinator");

  req.set_user_id(1);
  roster::v1::AssignResponse first;
  ::grpc::ServerContext      first_ctx;
  assert(server.Assign(&first_ctx, &req, &first).ok());
  assert(first.ok());

  req.set_user_id(2);
  roster::v1::AssignResponse second;
  ::grpc::ServerContext      second_ctx;
  assert(server.Assign(&second_ctx, &req, &second).ok());
  assert(!second.ok());
  assert(second.reason() == roster::v1::DECLINE_REASON_ROLE_TAKEN);
}

void TestMalformedRequestReturnsInvalidArgument() {
  auto                       app = BuildApp();
  roster::grpc::RosterServer server(app.service);

  roster::v1::GetRosterRequest req;
  roster::v1::GetRosterResponse resp;
  ::grpc::ServerContext         grpc_ctx;

  const auto status = server.GetRoster(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestAssignToMissingEventReturnsNotFound();
  TestDeclineIsAnOkStatus();
  TestMalformedRequestReturnsInvalidArgument();

  std::cout << "roster_unit_grpc_status: pass\n";
  return 0;
}
