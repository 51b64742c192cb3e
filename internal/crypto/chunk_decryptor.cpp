#include "chunk_decryptor.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace acquisition::crypto {

namespace {

constexpr std::size_t kBlockSize = 16;

std::atomic<std::uint64_t> g_next_session{1};

using CipherContextPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

[[noreturn]] void ThrowMisuse(const std::string& message) {
  throw util::DecryptionContextMisuse(message);
}

Bytes HmacSha256(const std::string& key, const std::string& message) {
  Bytes        out(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), reinterpret_cast<const unsigned char*>(message.data()), message.size(),
            out.data(), &len)) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  out.resize(len);
  return out;
}

std::string Md5Hex(const std::string& input) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  len = 0;
  if (!EVP_Digest(input.data(), input.size(), digest, &len, EVP_md5(), nullptr)) {
    throw std::runtime_error("MD5 failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           hex;
  hex.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    hex.push_back(kHex[digest[i] >> 4]);
    hex.push_back(kHex[digest[i] & 0x0F]);
  }
  return hex;
}

// 128-bit big-endian add
CounterBlock AddToCounter(const CounterBlock& base, std::uint64_t blocks) {
  CounterBlock  out   = base;
  std::uint64_t carry = blocks;
  for (int i = 15; i >= 0 && carry != 0; --i) {
    const std::uint64_t sum = static_cast<std::uint64_t>(out[i]) + (carry & 0xFF);
    out[i]                  = static_cast<std::uint8_t>(sum);
    carry                   = (carry >> 8) + (sum >> 8);
  }
  return out;
}

const EVP_CIPHER* CipherFor(std::size_t key_bytes) {
  switch (key_bytes) {
    case 16:
      return EVP_aes_128_ctr();
    case 24:
      return EVP_aes_192_ctr();
    case 32:
      return EVP_aes_256_ctr();
    default:
      ThrowMisuse("unsupported key length " + std::to_string(key_bytes));
  }
  return nullptr;
}

} // namespace

DerivedKey ChunkDecryptor::DeriveKey(model::KeyDerivation derivation, const std::string& track_ref, const std::string& seed,
                                     std::uint32_t key_bytes) {
  DerivedKey derived;

  switch (derivation) {
    case model::KeyDerivation::kHmacSha256: {
      if (key_bytes != 16 && key_bytes != 24 && key_bytes != 32) {
        ThrowMisuse("key length must be 16, 24 or 32 bytes");
      }
      auto key = HmacSha256(seed, "key|" + track_ref);
      auto iv  = HmacSha256(seed, "iv|" + track_ref);
      derived.key.assign(key.begin(), key.begin() + key_bytes);
      std::copy_n(iv.begin(), kBlockSize, derived.base_counter.begin());
      break;
    }
    case model::KeyDerivation::kMd5Xor: {
      if (key_bytes != 16) {
        ThrowMisuse("md5_xor derivation produces 16-byte keys");
      }
      if (seed.size() < 16) {
        ThrowMisuse("md5_xor derivation needs a seed of at least 16 bytes");
      }
      const auto hex = Md5Hex(track_ref);
      derived.key.resize(16);
      for (std::size_t i = 0; i < 16; ++i) {
        derived.key[i] = static_cast<std::uint8_t>(hex[i] ^ hex[i + 16] ^ seed[i]);
      }
      for (std::size_t i = 0; i < kBlockSize; ++i) {
        derived.base_counter[i] = static_cast<std::uint8_t>(i);
      }
      break;
    }
  }

  return derived;
}

EncryptedStreamContext ChunkDecryptor::Begin(const std::string& track_ref, const model::EncryptedStreamDelivery& delivery,
                                             const std::optional<std::string>& key_material) {
  if (delivery.chunk_size == 0 || delivery.chunk_size % kBlockSize != 0) {
    ThrowMisuse("chunk size must be a positive multiple of 16, got " + std::to_string(delivery.chunk_size));
  }

  EncryptedStreamContext context;
  context.track_ref  = track_ref;
  context.chunk_size = delivery.chunk_size;
  context.ordered    = delivery.ordered;
  context.plaintext  = delivery.plaintext;
  context.session_id = g_next_session.fetch_add(1);

  if (!delivery.plaintext) {
    const auto& seed = key_material && !key_material->empty() ? *key_material : delivery.key_seed;
    if (seed.empty()) {
      ThrowMisuse("no key seed for track " + track_ref);
    }
    auto derived         = DeriveKey(delivery.key_derivation, track_ref, seed, delivery.key_bytes);
    context.derived_key  = std::move(derived.key);
    context.base_counter = derived.base_counter;
  }

  return context;
}

Bytes ChunkDecryptor::Decrypt(EncryptedStreamContext& context, std::uint64_t chunk_index, const Bytes& encrypted_chunk) {
  if (context.chunk_size == 0) {
    ThrowMisuse("decrypt on an uninitialized context");
  }
  if (context.final_index && (context.ordered || chunk_index >= *context.final_index)) {
    ThrowMisuse("chunk " + std::to_string(chunk_index) + " after final chunk " + std::to_string(*context.final_index));
  }
  if (encrypted_chunk.size() > context.chunk_size) {
    ThrowMisuse("chunk of " + std::to_string(encrypted_chunk.size()) + " bytes exceeds chunk size " + std::to_string(context.chunk_size));
  }
  if (context.ordered && chunk_index != context.chunk_index) {
    throw util::OutOfSequenceChunk("expected chunk " + std::to_string(context.chunk_index) + ", got " + std::to_string(chunk_index));
  }

  auto plain = DecryptRange(context, chunk_index * context.chunk_size, encrypted_chunk);

  if (encrypted_chunk.size() < context.chunk_size) {
    context.final_index = chunk_index;
  }
  context.chunk_index = std::max(context.chunk_index, chunk_index + 1);

  return plain;
}

Bytes ChunkDecryptor::DecryptRange(const EncryptedStreamContext& context, std::uint64_t byte_offset, const Bytes& encrypted) {
  if (context.plaintext || encrypted.empty()) {
    return encrypted;
  }
  if (context.derived_key.empty()) {
    ThrowMisuse("decrypt on a context without key");
  }

  const auto* cipher  = CipherFor(context.derived_key.size());
  const auto  counter = AddToCounter(context.base_counter, byte_offset / kBlockSize);
  const auto  skip    = static_cast<int>(byte_offset % kBlockSize);

  CipherContextPtr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx || EVP_DecryptInit_ex(ctx.get(), cipher, nullptr, context.derived_key.data(), counter.data()) != 1) {
    throw std::runtime_error("cipher initialization failed");
  }

  int len = 0;

  // advance the keystream to the offset inside the first block
  if (skip > 0) {
    std::uint8_t scratch[kBlockSize] = {};
    if (EVP_DecryptUpdate(ctx.get(), scratch, &len, scratch, skip) != 1) {
      throw std::runtime_error("cipher update failed");
    }
  }

  Bytes plain(encrypted.size());
  if (EVP_DecryptUpdate(ctx.get(), plain.data(), &len, encrypted.data(), static_cast<int>(encrypted.size())) != 1) {
    throw std::runtime_error("cipher update failed");
  }
  plain.resize(static_cast<std::size_t>(len));

  return plain;
}

} // namespace acquisition::crypto
