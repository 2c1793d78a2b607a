#include "signature.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>
#include <stdexcept>

#include "internal/codec/borsh.hpp"

namespace heroes::crypto {

namespace {

using PkeyPtr  = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

PkeyPtr PrivateKey(const std::array<uint8_t, 32>& seed) {
  PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()), &EVP_PKEY_free);
  if (!key) throw std::runtime_error("EVP_PKEY_new_raw_private_key failed");
  return key;
}

MdCtxPtr NewMdCtx() {
  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
  return ctx;
}

} // namespace

Keypair Keypair::Generate() {
  std::array<uint8_t, 32> seed{};
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return FromSeed(seed);
}

Keypair Keypair::FromSeed(const std::array<uint8_t, 32>& seed) {
  auto                                      key = PrivateKey(seed);
  std::array<uint8_t, model::Pubkey::kSize> public_bytes{};
  std::size_t                               length = public_bytes.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), public_bytes.data(), &length) != 1 || length != public_bytes.size()) {
    throw std::runtime_error("EVP_PKEY_get_raw_public_key failed");
  }
  return Keypair(seed, model::Pubkey(public_bytes));
}

Signature Keypair::Sign(const std::vector<uint8_t>& message) const {
  auto key = PrivateKey(seed_);
  auto ctx = NewMdCtx();

  Signature   signature{};
  std::size_t length = signature.size();
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1 ||
      EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(), message.size()) != 1) {
    throw std::runtime_error("ed25519 signing failed");
  }
  return signature;
}

bool Verify(const model::Pubkey& key, const std::vector<uint8_t>& message, const Signature& signature) {
  PkeyPtr public_key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, key.data(), model::Pubkey::kSize), &EVP_PKEY_free);
  if (!public_key) return false;

  auto ctx = NewMdCtx();
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, public_key.get()) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message.data(), message.size()) == 1;
}

std::vector<uint8_t> SigningMessage(const model::Pubkey& program_id, const std::vector<host::AccountMeta>& metas, const std::vector<uint8_t>& data) {
  codec::BorshWriter writer;
  writer.WritePubkey(program_id);
  writer.WriteU32(static_cast<uint32_t>(metas.size()));
  for (const auto& meta : metas) {
    writer.WritePubkey(meta.key);
    writer.WriteU8(meta.is_signer ? 1 : 0);
    writer.WriteU8(meta.is_writable ? 1 : 0);
  }
  auto message = writer.Release();
  message.insert(message.end(), data.begin(), data.end());
  return message;
}

std::vector<uint8_t> MintToMessage(const model::Pubkey& token_program_id, const model::Pubkey& mint, const model::Pubkey& destination,
                                   const model::Pubkey& authority, uint64_t amount) {
  codec::BorshWriter data;
  data.WriteU64(amount);
  return SigningMessage(token_program_id, {{mint, false, true}, {destination, false, true}, {authority, true, false}}, data.Release());
}

} // namespace heroes::crypto
