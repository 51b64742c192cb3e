#pragma once

#include <vector>

#include "config/config.pb.h"
#include "internal/model/backend.hpp"
#include "internal/orchestrator/orchestrator_options.hpp"

namespace acquisition::config {

/*
  Translates the validated protobuf config into engine types. Unset
  fields take the engine defaults.
*/

std::vector<model::BackendProfile> BuildBackendProfiles(const acquisition::runtime::config::RuntimeConfig& config);

orchestrator::OrchestratorOptions BuildOrchestratorOptions(const acquisition::runtime::config::RuntimeConfig& config);

} // namespace acquisition::config
