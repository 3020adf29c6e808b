#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "roster/v1/roster_service.grpc.pb.h"

using namespace roster::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  rosterctl <addr> register <user_id> <first_name> [last_name] [handle]\n"
            << "  rosterctl <addr> locations\n"
            << "  rosterctl <addr> roles\n"
            << "  rosterctl <addr> open <location_name> [YYYY-MM-DD]\n"
            << "  rosterctl <addr> assign <user_id> <event_id> <role>\n"
            << "  rosterctl <addr> unassign <user_id> <event_id>\n"
            << "  rosterctl <addr> roster <event_id>\n";
}

static int64_t ParseId(const char* text) {
  try {
    return std::stoll(text);
  } catch (const std::exception&) {
    std::cerr << "invalid id: '" << text << "'\n";
    std::exit(1);
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = RosterService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "register") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    RegisterUserRequest req;
    auto*               user = req.mutable_user();
    user->set_user_id(ParseId(argv[3]));
    user->set_first_name(argv[4]);
    if (argc >= 6) user->set_last_name(argv[5]);
    if (argc >= 7) user->set_handle(argv[6]);

    RegisterUserResponse resp;
    auto status = stub->RegisterUser(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.created() ? "registered " : "known ") << resp.user().user_id() << " " << resp.user().full_name() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "locations") {
    ListLocationsResponse resp;
    auto status = stub->ListLocations(&ctx, ListLocationsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& location : resp.locations()) {
      std::cout << location.location_id() << "\t" << location.name() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "roles") {
    ListRolesResponse resp;
    auto status = stub->ListRoles(&ctx, ListRolesRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& role : resp.roles()) {
      std::cout << role.code() << "\t" << role.display_name() << (role.unique() ? "\tunique" : "") << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "open") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    OpenEventRequest req;
    req.set_location_name(argv[3]);
    if (argc >= 5) req.set_event_date(argv[4]);

    OpenEventResponse resp;
    auto status = stub->OpenEvent(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "event_id=" << resp.event().event_id() << " location=" << resp.location().name() << " date=" << resp.event().event_date()
              << (resp.created() ? " (created)" : "") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "assign") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    AssignRequest req;
    req.set_user_id(ParseId(argv[3]));
    req.set_event_id(ParseId(argv[4]));
    req.set_role_name(argv[5]);

    AssignResponse resp;
    auto status = stub->Assign(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.message() << "\n";
    return resp.ok() ? 0 : 3;
  }

  // ------------------------------------------------------------

  if (cmd == "unassign") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    UnassignRequest req;
    req.set_user_id(ParseId(argv[3]));
    req.set_event_id(ParseId(argv[4]));

    UnassignResponse resp;
    auto status = stub->Unassign(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "removed=" << resp.removed_count() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "roster") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetRosterRequest req;
    req.set_event_id(ParseId(argv[3]));

    GetRosterResponse resp;
    auto status = stub->GetRoster(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "event " << resp.event().event_id() << " on " << resp.event().event_date() << "\n";
    for (const auto& entry : resp.entries()) {
      std::cout << "  " << entry.role().display_name() << ": ";
      if (entry.assignee_user_id() != 0) {
        std::cout << entry.assignee_name();
        if (!entry.assignee_handle().empty()) std::cout << " (@" << entry.assignee_handle() << ")";
      }
      std::cout << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
