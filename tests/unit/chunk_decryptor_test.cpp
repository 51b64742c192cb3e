#include <openssl/evp.h>

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

#include "internal/crypto/chunk_decryptor.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_transport.hpp"

namespace {

using acquisition::crypto::Bytes;
using acquisition::crypto::ChunkDecryptor;
using acquisition::crypto::DerivedKey;
using acquisition::model::EncryptedStreamDelivery;
using acquisition::model::KeyDerivation;
using acquisition::testing::EncryptCtr;
using acquisition::testing::MakePayload;
using acquisition::testing::Slice;
using acquisition::util::DecryptionContextMisuse;
using acquisition::util::OutOfSequenceChunk;

constexpr std::uint32_t kChunk = 64 * 1024;

EncryptedStreamDelivery Delivery(bool ordered = true) {
  EncryptedStreamDelivery delivery;
  delivery.chunk_size = kChunk;
  delivery.key_seed   = "backend-wide-seed";
  delivery.ordered    = ordered;
  return delivery;
}

template <typename Fn>
bool ThrowsMisuse(Fn&& fn) {
  try {
    fn();
  } catch (const DecryptionContextMisuse&) {
    return true;
  }
  return false;
}

void TestHmacDerivationIsPerTrack() {
  auto a  = ChunkDecryptor::DeriveKey(KeyDerivation::kHmacSha256, "track-a", "seed", 16);
  auto a2 = ChunkDecryptor::DeriveKey(KeyDerivation::kHmacSha256, "track-a", "seed", 16);
  auto b  = ChunkDecryptor::DeriveKey(KeyDerivation::kHmacSha256, "track-b", "seed", 16);

  assert(a.key.size() == 16);
  assert(a.key == a2.key);
  assert(a.base_counter == a2.base_counter);
  assert(a.key != b.key);
  assert(a.base_counter != b.base_counter);

  auto wide = ChunkDecryptor::DeriveKey(KeyDerivation::kHmacSha256, "track-a", "seed", 32);
  assert(wide.key.size() == 32);
  // same HMAC output, longer prefix
  assert(std::equal(a.key.begin(), a.key.end(), wide.key.begin()));

  assert(ThrowsMisuse([] { ChunkDecryptor::DeriveKey(KeyDerivation::kHmacSha256, "t", "seed", 20); }));
}

void TestMd5XorDerivation() {
  const std::string track = "12345678";
  const std::string seed  = "0123456789abcdef";

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  len = 0;
  assert(EVP_Digest(track.data(), track.size(), digest, &len, EVP_md5(), nullptr) == 1);
  std::string hex;
  for (unsigned int i = 0; i < len; ++i) {
    static constexpr char kHex[] = "0123456789abcdef";
    hex.push_back(kHex[digest[i] >> 4]);
    hex.push_back(kHex[digest[i] & 0x0F]);
  }

  auto derived = ChunkDecryptor::DeriveKey(KeyDerivation::kMd5Xor, track, seed, 16);
  assert(derived.key.size() == 16);
  for (std::size_t i = 0; i < 16; ++i) {
    assert(derived.key[i] == static_cast<std::uint8_t>(hex[i] ^ hex[i + 16] ^ seed[i]));
    assert(derived.base_counter[i] == i);
  }

  assert(ThrowsMisuse([&] { ChunkDecryptor::DeriveKey(KeyDerivation::kMd5Xor, track, "short", 16); }));
  assert(ThrowsMisuse([&] { ChunkDecryptor::DeriveKey(KeyDerivation::kMd5Xor, track, seed, 32); }));
}

void TestOrderedStreamDecryptsThreeChunks() {
  const auto delivery = Delivery();
  const auto plain    = MakePayload(3 * kChunk);
  const auto key      = ChunkDecryptor::DeriveKey(delivery.key_derivation, "track-3", delivery.key_seed, delivery.key_bytes);
  const auto cipher   = EncryptCtr(key, plain);
  assert(cipher != plain);

  auto  ctx = ChunkDecryptor::Begin("track-3", delivery);
  Bytes out;
  for (std::uint64_t i = 0; i < 3; ++i) {
    auto chunk = ChunkDecryptor::Decrypt(ctx, i, Slice(cipher, {i * kChunk, kChunk}));
    out.insert(out.end(), chunk.begin(), chunk.end());
  }

  assert(out == plain);
  assert(ctx.chunk_index == 3);
  // exact multiple: no short chunk seen yet
  assert(!ctx.final_index.has_value());
}

void TestOrderedStreamRejectsGaps() {
  const auto delivery = Delivery();
  const auto cipher   = MakePayload(2 * kChunk);

  auto ctx = ChunkDecryptor::Begin("gap", delivery);
  (void)ChunkDecryptor::Decrypt(ctx, 0, Slice(cipher, {0, kChunk}));

  bool threw = false;
  try {
    (void)ChunkDecryptor::Decrypt(ctx, 2, Slice(cipher, {kChunk, kChunk}));
  } catch (const OutOfSequenceChunk&) {
    threw = true;
  }
  assert(threw);
  assert(ctx.chunk_index == 1);
}

void TestUnorderedStreamAcceptsAnyOrder() {
  const auto delivery = Delivery(false);
  const auto plain    = MakePayload(3 * kChunk);
  const auto key      = ChunkDecryptor::DeriveKey(delivery.key_derivation, "shuffled", delivery.key_seed, delivery.key_bytes);
  const auto cipher   = EncryptCtr(key, plain);

  auto ctx = ChunkDecryptor::Begin("shuffled", delivery);
  for (std::uint64_t i : {2u, 0u, 1u}) {
    auto chunk = ChunkDecryptor::Decrypt(ctx, i, Slice(cipher, {i * kChunk, kChunk}));
    assert(chunk == Slice(plain, {i * kChunk, kChunk}));
  }
  assert(ctx.chunk_index == 3);
}

void TestShortChunkIsFinal() {
  const auto delivery = Delivery();
  const auto plain    = MakePayload(kChunk + 1000);
  const auto key      = ChunkDecryptor::DeriveKey(delivery.key_derivation, "short", delivery.key_seed, delivery.key_bytes);
  const auto cipher   = EncryptCtr(key, plain);

  auto ctx = ChunkDecryptor::Begin("short", delivery);
  (void)ChunkDecryptor::Decrypt(ctx, 0, Slice(cipher, {0, kChunk}));
  auto tail = ChunkDecryptor::Decrypt(ctx, 1, Slice(cipher, {kChunk, kChunk}));

  assert(tail.size() == 1000);
  assert(tail == Slice(plain, {kChunk, 1000}));
  assert(ctx.final_index == 1u);

  assert(ThrowsMisuse([&] { (void)ChunkDecryptor::Decrypt(ctx, 2, Bytes(16)); }));
}

void TestOversizedChunkIsMisuse() {
  auto ctx = ChunkDecryptor::Begin("big", Delivery());
  assert(ThrowsMisuse([&] { (void)ChunkDecryptor::Decrypt(ctx, 0, Bytes(kChunk + 1)); }));
}

void TestRangeAtUnalignedOffset() {
  const auto delivery = Delivery();
  const auto plain    = MakePayload(4096);
  const auto key      = ChunkDecryptor::DeriveKey(delivery.key_derivation, "range", delivery.key_seed, delivery.key_bytes);
  const auto cipher   = EncryptCtr(key, plain);

  auto ctx = ChunkDecryptor::Begin("range", delivery);
  for (std::uint64_t offset : {0u, 15u, 16u, 37u, 4000u}) {
    auto out = ChunkDecryptor::DecryptRange(ctx, offset, Slice(cipher, {offset, 77}));
    assert(out == Slice(plain, {offset, 77}));
  }
}

void TestKeyMaterialOverridesConfiguredSeed() {
  const auto delivery = Delivery();
  const auto plain    = MakePayload(256);
  const auto key      = ChunkDecryptor::DeriveKey(delivery.key_derivation, "per-track", "issued-by-backend", delivery.key_bytes);
  const auto cipher   = EncryptCtr(key, plain);

  auto ctx = ChunkDecryptor::Begin("per-track", delivery, std::string("issued-by-backend"));
  assert(ChunkDecryptor::Decrypt(ctx, 0, cipher) == plain);

  auto wrong = ChunkDecryptor::Begin("per-track", delivery);
  assert(ChunkDecryptor::Decrypt(wrong, 0, cipher) != plain);
}

void TestPlaintextPassesThrough() {
  auto delivery      = Delivery();
  delivery.plaintext = true;
  delivery.key_seed.clear();

  const auto plain = MakePayload(1000);
  auto       ctx   = ChunkDecryptor::Begin("plain", delivery);
  assert(ChunkDecryptor::Decrypt(ctx, 0, plain) == plain);
  assert(ctx.final_index == 0u);
}

void TestBeginValidation() {
  auto bad_size       = Delivery();
  bad_size.chunk_size = 1000;
  assert(ThrowsMisuse([&] { ChunkDecryptor::Begin("t", bad_size); }));

  auto no_seed = Delivery();
  no_seed.key_seed.clear();
  assert(ThrowsMisuse([&] { ChunkDecryptor::Begin("t", no_seed); }));

  auto a = ChunkDecryptor::Begin("t", Delivery());
  auto b = ChunkDecryptor::Begin("t", Delivery());
  assert(a.session_id != b.session_id);
  assert(a.derived_key == b.derived_key);
}

} // namespace

int main() {
  TestHmacDerivationIsPerTrack();
  TestMd5XorDerivation();
  TestOrderedStreamDecryptsThreeChunks();
  TestOrderedStreamRejectsGaps();
  TestUnorderedStreamAcceptsAnyOrder();
  TestShortChunkIsFinal();
  TestOversizedChunkIsMisuse();
  TestRangeAtUnalignedOffset();
  TestKeyMaterialOverridesConfiguredSeed();
  TestPlaintextPassesThrough();
  TestBeginValidation();

  std::cout << "acquisition_unit_chunk_decryptor: pass\n";
  return 0;
}
