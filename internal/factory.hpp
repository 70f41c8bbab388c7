#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/autonomous/autonomous_worker.hpp"
#include "internal/db/api/repository.hpp"

namespace autopilot::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<autonomous::AutonomousWorker> worker;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  The only place allowed to know concrete DB types. The schema is
  bootstrapped before the repository is returned.
*/
std::shared_ptr<db::Repository> BuildRepository(const autopilot::runtime::config::RuntimeConfig& config);

// Composition root: engines, services and gRPC adapters. The worker is not started.
Application Build(const autopilot::runtime::config::RuntimeConfig& config);

} // namespace autopilot::factory
