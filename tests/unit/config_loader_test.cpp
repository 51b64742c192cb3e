#include "internal/config/config_loader.hpp"
#include "internal/config/runtime_settings.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>

namespace {

using acquisition::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "acquisition_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\acquisition\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\acquisition\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
database:
  memory: {}
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
  assert(config.database().has_memory());
}

void TestQuotedNumericScalarStaysString() {
  const auto yaml_path = WriteYaml("quoted_numeric",
                                   R"(backends:
  - id: "0001"
    encrypted_stream:
      key_seed: "1234567890123456"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.backends_size() == 1);
  assert(config.backends(0).id() == "0001");
  assert(config.backends(0).encrypted_stream().key_seed() == "1234567890123456");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field", R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)") && "ConfigLoader must reject unknown fields.");

  assert(Rejects("unknown_backend_field", R"(backends:
  - id: "store"
    chunk_size: 4096
    encrypted_stream: {}
)"));
}

void TestInvalidBackendsAreRejected() {
  assert(Rejects("duplicate_backend", R"(backends:
  - id: "store"
    encrypted_stream: {}
  - id: "store"
    peer_transfer: {}
)"));

  assert(Rejects("empty_backend_id", R"(backends:
  - id: ""
    encrypted_stream: {}
)"));

  assert(Rejects("missing_delivery", R"(backends:
  - id: "store"
    min_interval: "1s"
)"));

  assert(Rejects("unaligned_chunk", R"(backends:
  - id: "store"
    encrypted_stream:
      chunk_size: 1000
)"));

  assert(Rejects("bad_key_bytes", R"(backends:
  - id: "store"
    encrypted_stream:
      key_bytes: 20
)"));

  assert(Rejects("short_md5_seed", R"(backends:
  - id: "store"
    encrypted_stream:
      key_derivation: KEY_DERIVATION_MD5_XOR
      key_seed: "too-short"
)"));

  assert(Rejects("zero_poll_interval", R"(backends:
  - id: "peer"
    peer_transfer:
      poll_interval: "0s"
)"));
}

void TestInvalidOrchestratorSettingsAreRejected() {
  assert(Rejects("shrinking_backoff", R"(orchestrator:
  backoff_multiplier: 0.5
)"));

  assert(Rejects("zero_job_timeout", R"(orchestrator:
  job_timeout: "0s"
)"));

  assert(Rejects("sqlite_without_path", R"(database:
  sqlite:
    wal_mode: true
)"));
}

void TestDefaultsFillUnsetFields() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(backends:
  - id: "store"
    encrypted_stream:
      key_seed: "seed"
  - id: "peer"
    peer_transfer: {}
)");

  auto config  = ConfigLoader::LoadFromYaml(yaml_path.string());
  auto options = acquisition::config::BuildOrchestratorOptions(config);
  assert(options.workers_per_backend == 1);
  assert(options.max_attempts == 3);
  assert(options.backoff_initial.count() == 1000);
  assert(options.backoff_multiplier == 2.0);
  assert(options.backoff_max.count() == 30000);
  assert(!options.job_timeout.has_value());
  assert(options.timeout_retries == 1);

  auto profiles = acquisition::config::BuildBackendProfiles(config);
  assert(profiles.size() == 2);

  const auto& store = profiles[0];
  assert(store.backend_id == "store");
  assert(store.min_interval.count() == 0);
  assert(store.credentials.refresh_margin.count() == 60000);
  assert(!store.credentials.allow_reauthenticate);
  const auto& stream = std::get<acquisition::model::EncryptedStreamDelivery>(store.delivery);
  assert(stream.chunk_size == 64 * 1024);
  assert(stream.key_seed == "seed");
  assert(stream.key_derivation == acquisition::model::KeyDerivation::kHmacSha256);
  assert(stream.key_bytes == 16);
  assert(stream.ordered);
  assert(stream.chunk_retry_limit == 2);
  assert(!stream.plaintext);

  const auto& peer = std::get<acquisition::model::PeerTransferDelivery>(profiles[1].delivery);
  assert(peer.poll_interval.count() == 1000);
  assert(peer.max_queued_polls == 120);
}

void TestExplicitSettingsOverrideDefaults() {
  const auto yaml_path = WriteYaml("explicit",
                                   R"(orchestrator:
  workers_per_backend: 4
  max_attempts: 5
  backoff_initial: "0.25s"
  backoff_multiplier: 1.5
  backoff_max: "10s"
  job_timeout: "600s"
  timeout_retries: 0
backends:
  - id: "store"
    min_interval: "0.5s"
    burst_allowance: 3
    credentials:
      refresh_margin: "30s"
      allow_reauthenticate: true
    encrypted_stream:
      chunk_size: 2048
      key_derivation: KEY_DERIVATION_MD5_XOR
      key_seed: "0123456789abcdef"
      ordered: false
      chunk_retry_limit: 0
  - id: "peer"
    peer_transfer:
      poll_interval: "2s"
      max_queued_polls: 10
)");

  auto config  = ConfigLoader::LoadFromYaml(yaml_path.string());
  auto options = acquisition::config::BuildOrchestratorOptions(config);
  assert(options.workers_per_backend == 4);
  assert(options.max_attempts == 5);
  assert(options.backoff_initial.count() == 250);
  assert(options.backoff_multiplier == 1.5);
  assert(options.backoff_max.count() == 10000);
  assert(options.job_timeout && options.job_timeout->count() == 600000);
  // explicit zero is kept, not replaced by the default
  assert(options.timeout_retries == 0);

  auto profiles = acquisition::config::BuildBackendProfiles(config);
  const auto& store = profiles[0];
  assert(store.min_interval.count() == 500);
  assert(store.burst_allowance == 3);
  assert(store.credentials.refresh_margin.count() == 30000);
  assert(store.credentials.allow_reauthenticate);

  const auto& stream = std::get<acquisition::model::EncryptedStreamDelivery>(store.delivery);
  assert(stream.chunk_size == 2048);
  assert(stream.key_derivation == acquisition::model::KeyDerivation::kMd5Xor);
  assert(!stream.ordered);
  assert(stream.chunk_retry_limit == 0);

  const auto& peer = std::get<acquisition::model::PeerTransferDelivery>(profiles[1].delivery);
  assert(peer.poll_interval.count() == 2000);
  assert(peer.max_queued_polls == 10);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/acquisition.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestQuotedNumericScalarStaysString();
  TestUnknownFieldsAreRejected();
  TestInvalidBackendsAreRejected();
  TestInvalidOrchestratorSettingsAreRejected();
  TestDefaultsFillUnsetFields();
  TestExplicitSettingsOverrideDefaults();
  TestMissingFileIsReported();

  std::cout << "acquisition_unit_config_loader: pass\n";
  return 0;
}
