#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/catalog/role_catalog.hpp"
#include "internal/core/assignment_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/directory/directory.hpp"
#include "internal/projection/roster_projector.hpp"
#include "internal/service/roster_service.hpp"

namespace roster::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<const catalog::RoleCatalog>  catalog;
  std::shared_ptr<core::AssignmentEngine>      engine;
  std::shared_ptr<projection::RosterProjector> projector;
  std::shared_ptr<directory::Directory>        directory;
  std::shared_ptr<service::RosterService>      service;
};

core::EngineOptions ToEngineOptions(const roster::runtime::config::EngineConfig& config);

directory::DirectoryOptions ToDirectoryOptions(const roster::runtime::config::ScheduleConfig& config);

/*
  Selects the backend from config.database (memory when unset) and
  bootstraps its schema.

  NOTE:
  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const roster::runtime::config::RuntimeConfig& config);

// Seeds catalogue and locations, loads the catalogue, wires the services.
Application Build(const roster::runtime::config::RuntimeConfig& config);

} // namespace roster::factory
