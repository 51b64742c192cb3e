#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/runtime_settings.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/acquisition_server.hpp"
#include "internal/grpc/credential_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/acquisition_service.hpp"
#include "internal/service/credential_service.hpp"
#include "internal/service/service_context.hpp"
#if ACQUISITION_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace acquisition::factory {

using namespace acquisition;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const acquisition::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ACQUISITION_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    ACQUISITION_LOG_INFO("using sqlite repository", {observability::StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const acquisition::runtime::config::RuntimeConfig& config, const AdapterMap& adapters) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.repository   = BuildRepository(config);
  app.credentials  = std::make_shared<credential::CredentialStore>(app.repository);
  app.governor     = std::make_shared<rate::RateGovernor>();
  app.orchestrator = std::make_shared<orchestrator::JobOrchestrator>(config::BuildOrchestratorOptions(config), app.credentials,
                                                                     app.governor, app.repository);

  // ------------------------------------------------------------------
  // Backends
  // ------------------------------------------------------------------
  for (const auto& profile : config::BuildBackendProfiles(config)) {
    auto it = adapters.find(profile.backend_id);
    if (it == adapters.end() || !it->second) {
      ACQUISITION_LOG_WARN("no transport adapter for backend, skipping", {observability::StringField("backend", profile.backend_id)});
      continue;
    }
    app.orchestrator->RegisterBackend(profile, it->second);
  }

  app.orchestrator->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.orchestrator = app.orchestrator;
  ctx.credentials  = app.credentials;
  ctx.output_root  = config.output().root_path().empty() ? std::filesystem::path(".") : std::filesystem::path(config.output().root_path());
  ctx.fsync        = config.output().fsync();

  auto acquisition_service = std::make_shared<service::AcquisitionService>(ctx);
  auto credential_service  = std::make_shared<service::CredentialService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AcquisitionServer>(acquisition_service));
  app.grpc_services.push_back(std::make_unique<grpc::CredentialServer>(credential_service));

  return app;
}

} // namespace acquisition::factory
