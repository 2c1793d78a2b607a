#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "internal/host/account_meta.hpp"
#include "internal/model/pubkey.hpp"

namespace heroes::crypto {

inline constexpr std::size_t kSignatureSize = 64;

using Signature = std::array<uint8_t, kSignatureSize>;

/*
  ed25519 keypair held as its 32 byte private seed.
*/
class Keypair {
 public:
  static Keypair Generate();
  static Keypair FromSeed(const std::array<uint8_t, 32>& seed);

  const model::Pubkey& pubkey() const {
    return pubkey_;
  }

  Signature Sign(const std::vector<uint8_t>& message) const;

 private:
  Keypair(const std::array<uint8_t, 32>& seed, model::Pubkey pubkey) : seed_(seed), pubkey_(pubkey) {
  }

  std::array<uint8_t, 32> seed_;
  model::Pubkey           pubkey_;
};

bool Verify(const model::Pubkey& key, const std::vector<uint8_t>& message, const Signature& signature);

// program_id || u32 n || n x (key, is_signer u8, is_writable u8) || data
std::vector<uint8_t> SigningMessage(const model::Pubkey& program_id, const std::vector<host::AccountMeta>& metas, const std::vector<uint8_t>& data);

// Message the mint authority signs for a token mint_to: SigningMessage over
// (mint w, destination w, authority s) with data = u64 amount.
std::vector<uint8_t> MintToMessage(const model::Pubkey& token_program_id, const model::Pubkey& mint, const model::Pubkey& destination,
                                   const model::Pubkey& authority, uint64_t amount);

} // namespace heroes::crypto
