#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include "internal/external/signer_seeds.hpp"
#include "internal/model/pubkey.hpp"

namespace heroes::authority {

/*
  Program-derived addresses.

  address = sha256(seed_0 || ... || seed_n || program_id || "ProgramDerivedAddress")

  A valid program address must NOT be a point on the ed25519 curve, so no
  private key can exist for it; only the owning program can sign for it by
  presenting the seeds.
*/

inline constexpr std::size_t kMaxSeeds      = 16;
inline constexpr std::size_t kMaxSeedLength = 32;

// nullopt when the hash lands on the curve. Throws util::AuthorizationError(InvalidSeeds)
// when the seeds exceed kMaxSeeds / kMaxSeedLength.
std::optional<model::Pubkey> CreateProgramAddress(const external::SignerSeeds& seeds, const model::Pubkey& program_id);

// Searches bump seeds 255..1, appending each as a final one-byte seed, and
// returns the first off-curve address with its bump.
// Throws util::AuthorizationError(InvalidSeeds) when the keyspace is exhausted.
std::pair<model::Pubkey, uint8_t> FindProgramAddress(const external::SignerSeeds& seeds, const model::Pubkey& program_id);

// True when the 32 bytes decompress to an ed25519 point.
bool IsOnCurve(const model::Pubkey& key);

} // namespace heroes::authority
