#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/credential.hpp"

namespace acquisition::transport {

using Bytes = std::vector<std::uint8_t>;

struct ByteRange {
  std::uint64_t offset = 0;
  std::uint64_t length = 0;
};

struct TrackMetadata {
  std::string   track_ref;
  std::uint64_t size_bytes = 0;

  // per-track key seed handed out by the backend, if any
  std::optional<std::string> key_material;

  std::string title;
  std::string artist;
  std::string format;
};

struct TransferRef {
  std::string peer_ref;
  std::string remote_file_ref;
};

/*
  Raw status as reported by a peer backend. The transfer poller owns the
  mapping of `state` onto its own vocabulary.
*/
struct RemoteTransferStatus {
  std::string   state;
  std::uint64_t bytes_transferred = 0;
  std::uint64_t size_bytes        = 0;
  std::string   error_message;

  // where the peer client placed the finished file
  std::string local_path;
};

/*
  TransportAdapter

  One per backend. Performs the network calls; the engine only sees this
  capability set. Implementations signal failures with:

    util::AuthDenied      credential rejected (401)
    util::RateLimited     backend throttled us (429)
    util::TransportError  network failure / 5xx
    util::NotFound        track, peer or file does not exist

  A capability the backend does not provide throws util::Unsupported.
*/
class TransportAdapter {
 public:
  virtual ~TransportAdapter() = default;

  virtual std::string BackendId() const = 0;

  // Non-interactive login. `scope` is the scope of the previous credential, if any.
  virtual model::Credential Authenticate(const std::string& scope);

  virtual model::Credential Refresh(const model::Credential& credential);

  virtual TrackMetadata FetchMetadata(const model::Credential& credential, const std::string& track_ref);

  virtual Bytes FetchEncryptedBytes(const model::Credential& credential, const std::string& track_ref, ByteRange range);

  virtual TransferRef InitiateTransfer(const model::Credential& credential, const std::string& track_ref);

  virtual RemoteTransferStatus PollTransferStatus(const model::Credential& credential, const std::string& peer_ref,
                                                  const std::string& remote_file_ref);
};

} // namespace acquisition::transport
