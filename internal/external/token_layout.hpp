#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "internal/model/pubkey.hpp"

namespace heroes::external {

/*
  Binary layouts owned by the token service (SPL token compatible).

  Token account, 165 bytes:
    mint(32) owner(32) amount(u64) delegate(COption<Pubkey>)
    state(u8) is_native(COption<u64>) delegated_amount(u64)
    close_authority(COption<Pubkey>)

  Mint, 82 bytes:
    mint_authority(COption<Pubkey>) supply(u64) decimals(u8)
    is_initialized(u8) freeze_authority(COption<Pubkey>)

  COption is a u32 tag (0 = none, 1 = some) followed by the value, which is
  always present in the layout.
*/

inline constexpr std::size_t kTokenAccountSize = 165;
inline constexpr std::size_t kMintSize         = 82;

enum class TokenAccountStatus : uint8_t {
  kUninitialized = 0,
  kInitialized   = 1,
  kFrozen        = 2,
};

struct TokenAccount {
  model::Pubkey                mint;
  model::Pubkey                owner;
  uint64_t                     amount = 0;
  std::optional<model::Pubkey> delegate;
  TokenAccountStatus           state = TokenAccountStatus::kUninitialized;
  std::optional<uint64_t>      is_native;
  uint64_t                     delegated_amount = 0;
  std::optional<model::Pubkey> close_authority;
};

struct Mint {
  std::optional<model::Pubkey> mint_authority;
  uint64_t                     supply         = 0;
  uint8_t                      decimals       = 0;
  bool                         is_initialized = false;
  std::optional<model::Pubkey> freeze_authority;
};

// Throw util::DataIntegrityError(InvalidAccountData) on a wrong size,
// unknown option tag or unknown account state.
TokenAccount UnpackTokenAccount(const uint8_t* data, std::size_t size);
Mint         UnpackMint(const uint8_t* data, std::size_t size);

// Write exactly kTokenAccountSize / kMintSize bytes.
void PackTokenAccount(const TokenAccount& account, uint8_t* out);
void PackMint(const Mint& mint, uint8_t* out);

} // namespace heroes::external
