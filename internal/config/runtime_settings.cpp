#include "runtime_settings.hpp"

#include "internal/util/time.hpp"

namespace acquisition::config {

using acquisition::runtime::config::BackendConfig;
using acquisition::runtime::config::RuntimeConfig;

namespace {

model::EncryptedStreamDelivery ToDelivery(const acquisition::runtime::config::EncryptedStreamConfig& stream) {
  model::EncryptedStreamDelivery delivery;
  if (stream.chunk_size() > 0) {
    delivery.chunk_size = stream.chunk_size();
  }
  delivery.key_seed = stream.key_seed();
  if (stream.key_derivation() == acquisition::runtime::config::KEY_DERIVATION_MD5_XOR) {
    delivery.key_derivation = model::KeyDerivation::kMd5Xor;
  }
  if (stream.key_bytes() > 0) {
    delivery.key_bytes = stream.key_bytes();
  }
  if (stream.has_ordered()) {
    delivery.ordered = stream.ordered();
  }
  if (stream.has_chunk_retry_limit()) {
    delivery.chunk_retry_limit = stream.chunk_retry_limit();
  }
  delivery.plaintext = stream.plaintext();
  return delivery;
}

model::PeerTransferDelivery ToDelivery(const acquisition::runtime::config::PeerTransferConfig& peer) {
  model::PeerTransferDelivery delivery;
  if (peer.has_poll_interval()) {
    delivery.poll_interval = util::ToMillis(peer.poll_interval());
  }
  if (peer.max_queued_polls() > 0) {
    delivery.max_queued_polls = peer.max_queued_polls();
  }
  return delivery;
}

} // namespace

std::vector<model::BackendProfile> BuildBackendProfiles(const RuntimeConfig& config) {
  std::vector<model::BackendProfile> profiles;
  profiles.reserve(config.backends_size());

  for (const auto& backend : config.backends()) {
    model::BackendProfile profile;
    profile.backend_id      = backend.id();
    profile.min_interval    = util::ToMillis(backend.min_interval());
    profile.burst_allowance = backend.burst_allowance();

    if (backend.credentials().has_refresh_margin()) {
      profile.credentials.refresh_margin = util::ToMillis(backend.credentials().refresh_margin());
    }
    profile.credentials.allow_reauthenticate = backend.credentials().allow_reauthenticate();

    if (backend.delivery_case() == BackendConfig::kPeerTransfer) {
      profile.delivery = ToDelivery(backend.peer_transfer());
    } else {
      profile.delivery = ToDelivery(backend.encrypted_stream());
    }

    profiles.push_back(std::move(profile));
  }
  return profiles;
}

orchestrator::OrchestratorOptions BuildOrchestratorOptions(const RuntimeConfig& config) {
  const auto&                       proto = config.orchestrator();
  orchestrator::OrchestratorOptions options;

  if (proto.workers_per_backend() > 0) options.workers_per_backend = proto.workers_per_backend();
  if (proto.max_attempts() > 0) options.max_attempts = proto.max_attempts();
  if (proto.has_backoff_initial()) options.backoff_initial = util::ToMillis(proto.backoff_initial());
  if (proto.backoff_multiplier() > 0) options.backoff_multiplier = proto.backoff_multiplier();
  if (proto.has_backoff_max()) options.backoff_max = util::ToMillis(proto.backoff_max());
  if (proto.has_job_timeout()) options.job_timeout = util::ToMillis(proto.job_timeout());
  if (proto.has_timeout_retries()) options.timeout_retries = proto.timeout_retries();
  if (proto.poll_error_limit() > 0) options.poll_error_limit = proto.poll_error_limit();
  if (proto.max_retained_jobs() > 0) options.max_retained_jobs = proto.max_retained_jobs();

  return options;
}

} // namespace acquisition::config
