#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace acquisition::model {

enum class KeyDerivation : std::uint8_t {
  kHmacSha256 = 0,
  kMd5Xor     = 1,
};

/*
  Encrypted (or plaintext) byte-range delivery, decrypted chunk by chunk.
*/
struct EncryptedStreamDelivery {
  std::uint32_t chunk_size = 64 * 1024;
  std::string   key_seed;
  KeyDerivation key_derivation    = KeyDerivation::kHmacSha256;
  std::uint32_t key_bytes         = 16;
  bool          ordered           = true;
  std::uint32_t chunk_retry_limit = 2;
  bool          plaintext         = false;
};

/*
  Peer-mediated transfer driven to completion by status polling.
*/
struct PeerTransferDelivery {
  std::chrono::milliseconds poll_interval{1000};
  std::uint32_t             max_queued_polls = 120;
};

using Delivery = std::variant<EncryptedStreamDelivery, PeerTransferDelivery>;

struct CredentialPolicy {
  std::chrono::milliseconds refresh_margin{60'000};
  bool                      allow_reauthenticate = false;
};

struct BackendProfile {
  std::string backend_id;

  std::chrono::milliseconds min_interval{0};
  std::uint32_t             burst_allowance = 0;

  CredentialPolicy credentials;
  Delivery         delivery;
};

} // namespace acquisition::model
