#pragma once

#include <filesystem>
#include <memory>

namespace acquisition::orchestrator {
class JobOrchestrator;
}
namespace acquisition::credential {
class CredentialStore;
}

namespace acquisition::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<acquisition::orchestrator::JobOrchestrator> orchestrator;
  std::shared_ptr<acquisition::credential::CredentialStore>   credentials;

  // completed tracks land under this directory
  std::filesystem::path output_root;
  bool                  fsync = false;
};

} // namespace acquisition::service
