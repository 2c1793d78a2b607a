#include "token_layout.hpp"

#include <cstring>
#include <string>

#include "internal/codec/borsh.hpp"
#include "internal/util/errors.hpp"

namespace heroes::external {

namespace {

using util::DataIntegrityError;
using util::ErrorCode;

uint32_t ReadTag(const uint8_t* p) {
  const uint32_t tag = codec::LoadU32(p);
  if (tag > 1) {
    throw DataIntegrityError(ErrorCode::InvalidAccountData, "invalid option tag " + std::to_string(tag));
  }
  return tag;
}

std::optional<model::Pubkey> ReadKeyOption(const uint8_t* p) {
  if (ReadTag(p) == 0) return std::nullopt;
  return model::Pubkey::FromBytes(p + 4);
}

std::optional<uint64_t> ReadU64Option(const uint8_t* p) {
  if (ReadTag(p) == 0) return std::nullopt;
  return codec::LoadU64(p + 4);
}

void WriteKeyOption(uint8_t* p, const std::optional<model::Pubkey>& key) {
  codec::StoreU32(p, key ? 1 : 0);
  if (key) {
    std::memcpy(p + 4, key->data(), model::Pubkey::kSize);
  } else {
    std::memset(p + 4, 0, model::Pubkey::kSize);
  }
}

void WriteU64Option(uint8_t* p, const std::optional<uint64_t>& value) {
  codec::StoreU32(p, value ? 1 : 0);
  codec::StoreU64(p + 4, value.value_or(0));
}

void ExpectSize(const char* what, std::size_t actual, std::size_t expected) {
  if (actual != expected) {
    throw DataIntegrityError(ErrorCode::InvalidAccountData,
                             std::string(what) + " data is " + std::to_string(actual) + " bytes, expected " + std::to_string(expected));
  }
}

} // namespace

TokenAccount UnpackTokenAccount(const uint8_t* data, std::size_t size) {
  ExpectSize("token account", size, kTokenAccountSize);

  TokenAccount account;
  account.mint     = model::Pubkey::FromBytes(data);
  account.owner    = model::Pubkey::FromBytes(data + 32);
  account.amount   = codec::LoadU64(data + 64);
  account.delegate = ReadKeyOption(data + 72);

  const uint8_t state = data[108];
  if (state > static_cast<uint8_t>(TokenAccountStatus::kFrozen)) {
    throw DataIntegrityError(ErrorCode::InvalidAccountData, "invalid token account state " + std::to_string(state));
  }
  account.state            = static_cast<TokenAccountStatus>(state);
  account.is_native        = ReadU64Option(data + 109);
  account.delegated_amount = codec::LoadU64(data + 121);
  account.close_authority  = ReadKeyOption(data + 129);
  return account;
}

void PackTokenAccount(const TokenAccount& account, uint8_t* out) {
  std::memcpy(out, account.mint.data(), model::Pubkey::kSize);
  std::memcpy(out + 32, account.owner.data(), model::Pubkey::kSize);
  codec::StoreU64(out + 64, account.amount);
  WriteKeyOption(out + 72, account.delegate);
  out[108] = static_cast<uint8_t>(account.state);
  WriteU64Option(out + 109, account.is_native);
  codec::StoreU64(out + 121, account.delegated_amount);
  WriteKeyOption(out + 129, account.close_authority);
}

Mint UnpackMint(const uint8_t* data, std::size_t size) {
  ExpectSize("mint", size, kMintSize);

  Mint mint;
  mint.mint_authority   = ReadKeyOption(data);
  mint.supply           = codec::LoadU64(data + 36);
  mint.decimals         = data[44];
  mint.is_initialized   = data[45] != 0;
  mint.freeze_authority = ReadKeyOption(data + 46);
  return mint;
}

void PackMint(const Mint& mint, uint8_t* out) {
  WriteKeyOption(out, mint.mint_authority);
  codec::StoreU64(out + 36, mint.supply);
  out[44] = mint.decimals;
  out[45] = mint.is_initialized ? 1 : 0;
  WriteKeyOption(out + 46, mint.freeze_authority);
}

} // namespace heroes::external
