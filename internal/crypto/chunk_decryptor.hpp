#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/backend.hpp"
#include "internal/transport/transport_adapter.hpp"

namespace acquisition::crypto {

using transport::Bytes;

using CounterBlock = std::array<std::uint8_t, 16>;

struct DerivedKey {
  Bytes        key;
  CounterBlock base_counter{};
};

/*
  Decryption state of one job attempt. Never persisted and never carried
  across attempts; session_id tells contexts apart.
*/
struct EncryptedStreamContext {
  std::string track_ref;

  Bytes        derived_key;
  CounterBlock base_counter{};

  std::uint32_t chunk_size = 0;

  // next expected index (ordered) or highest seen + 1 (unordered)
  std::uint64_t chunk_index = 0;

  // set once a short chunk has been seen
  std::optional<std::uint64_t> final_index;

  bool ordered   = true;
  bool plaintext = false;

  std::uint64_t session_id = 0;
};

/*
  ChunkDecryptor

  AES-CTR over a chunked stream. The counter for byte offset `o` is
  base_counter + o / 16, so any chunk (and any range) can be decrypted
  independently of the others.

  Errors:
    util::DecryptionContextMisuse  bad parameters, oversized chunk, chunk after the final one
    util::OutOfSequenceChunk       ordered stream received an unexpected index
*/
class ChunkDecryptor {
 public:
  static DerivedKey DeriveKey(model::KeyDerivation derivation, const std::string& track_ref, const std::string& seed,
                              std::uint32_t key_bytes);

  // `key_material` from the backend overrides the configured seed.
  static EncryptedStreamContext Begin(const std::string& track_ref, const model::EncryptedStreamDelivery& delivery,
                                      const std::optional<std::string>& key_material = std::nullopt);

  static Bytes Decrypt(EncryptedStreamContext& context, std::uint64_t chunk_index, const Bytes& encrypted_chunk);

  static Bytes DecryptRange(const EncryptedStreamContext& context, std::uint64_t byte_offset, const Bytes& encrypted);
};

} // namespace acquisition::crypto
