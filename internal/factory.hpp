#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/core/protocol_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/timeout/sweep_worker.hpp"

namespace nsi::factory {

/*
  Application

  Owns every long-lived object built from the runtime config. Workers
  are stopped when the application is destroyed.
*/
struct Application {
  std::shared_ptr<db::Repository>       repository;
  std::shared_ptr<core::ProtocolEngine> engine;

  std::vector<std::unique_ptr<::grpc::Service>>     grpc_services;
  std::vector<std::shared_ptr<timeout::SweepWorker>> background_workers;
};

/*
  Composition root. The only place that knows the concrete repository
  and transport types.
*/
Application Build(const nsi::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const nsi::runtime::config::RuntimeConfig& config);
core::EngineOptions             BuildEngineOptions(const nsi::runtime::config::RuntimeConfig& config);

// Throws std::runtime_error for a configured interval that is not positive.
std::chrono::milliseconds BuildSweepInterval(const nsi::runtime::config::RuntimeConfig& config);

} // namespace nsi::factory
