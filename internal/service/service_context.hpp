#pragma once

#include <memory>

namespace roster::core { class AssignmentEngine; }
namespace roster::projection { class RosterProjector; }
namespace roster::directory { class Directory; }
namespace roster::catalog { class RoleCatalog; }

namespace roster::service {

/*
  Dependency container shared by the service facade.
*/
struct ServiceContext {
  std::shared_ptr<roster::core::AssignmentEngine> engine;
  std::shared_ptr<roster::projection::RosterProjector> projector;
  std::shared_ptr<roster::directory::Directory> directory;
  std::shared_ptr<const roster::catalog::RoleCatalog> catalog;
};

}
