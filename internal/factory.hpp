#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "internal/credential/credential_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/orchestrator/job_orchestrator.hpp"
#include "internal/rate/rate_governor.hpp"
#include "internal/transport/transport_adapter.hpp"

namespace acquisition::factory {

// Transport adapters keyed by backend id. Supplied by the embedding program.
using AdapterMap = std::unordered_map<std::string, std::shared_ptr<transport::TransportAdapter>>;

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<db::Repository>                repository;
  std::shared_ptr<credential::CredentialStore>   credentials;
  std::shared_ptr<rate::RateGovernor>            governor;
  std::shared_ptr<orchestrator::JobOrchestrator> orchestrator;
};

/*
  Build

  Constructs the entire engine from the runtime config. This is the
  composition root: the only place that knows concrete DB types.

  Configured backends without an adapter are skipped with a warning.
  The returned orchestrator is already started.
*/
Application Build(const acquisition::runtime::config::RuntimeConfig& config, const AdapterMap& adapters = {});

} // namespace acquisition::factory
