#pragma once

#include <cstdint>

#include "internal/account/account_info.hpp"
#include "internal/model/pubkey.hpp"

namespace heroes::oracle {

struct Holding {
  model::Pubkey holder;
  model::Pubkey asset;
  uint64_t      amount = 0;
};

/*
  Read-only view of token-holding accounts.

  The token service owns the format; a malformed or foreign-owned record is a
  fatal validation error for the calling instruction, never retried.
*/
class OwnershipOracle {
 public:
  explicit OwnershipOracle(model::Pubkey token_program_id) : token_program_id_(token_program_id) {
  }

  // Throws AuthorizationError(IncorrectProgramId) when the account is not owned
  // by the token program, DataIntegrityError(InvalidAccountData) when malformed
  // or uninitialized.
  Holding CurrentHolder(const account::AccountInfo& token_account) const;

  // CurrentHolder, then AuthorizationError(InvalidArgument) unless `holder`
  // holds at least one unit of `asset` in this account.
  Holding RequireHolder(const account::AccountInfo& token_account, const model::Pubkey& holder, const model::Pubkey& asset) const;

  const model::Pubkey& token_program_id() const {
    return token_program_id_;
  }

 private:
  model::Pubkey token_program_id_;
};

} // namespace heroes::oracle
