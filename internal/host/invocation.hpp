#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "internal/account/account_info.hpp"
#include "internal/external/signer_seeds.hpp"
#include "internal/host/effect.hpp"
#include "internal/model/pubkey.hpp"

namespace heroes::host {

/*
  Context of a cross-program call made by the running instruction.

  caller_program_id is the program whose seeds may sign for derived
  addresses. Completed calls are appended to `effects`.
*/
struct Invocation {
  model::Pubkey caller_program_id;
  EffectLog*    effects = nullptr;

  void Record(Effect effect) const;
};

// The authority signed directly, or `seeds` derive its address under the caller program.
// Throws util::ExternalCallFailure(MissingRequiredSignature) otherwise.
void VerifyAuthority(const Invocation& invocation, const account::AccountInfo& authority, const external::SignerSeeds* seeds);

// Throws util::ExternalCallFailure(ExternalCallFailed) unless `account` is owned by `program_id`.
void RequireOwnedBy(const account::AccountInfo& account, const model::Pubkey& program_id, std::string_view what);

// Mutable data of a writable account holding exactly `size` bytes.
uint8_t* WritableData(account::AccountInfo& account, std::size_t size);

} // namespace heroes::host
