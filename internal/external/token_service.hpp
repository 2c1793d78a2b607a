#pragma once

#include <cstdint>

#include "internal/account/account_info.hpp"
#include "internal/external/signer_seeds.hpp"
#include "internal/model/pubkey.hpp"

namespace heroes::external {

/*
  External token service.

  Every call either completes or throws (util::ExternalCallFailure for a
  rejected request, util::DataIntegrityError for malformed accounts).
  The ledger never retries.
*/
class TokenService {
 public:
  virtual ~TokenService() = default;

  // owner grants `delegate` authority over `amount` units held in `source`.
  virtual void Approve(account::AccountInfo& source, const model::Pubkey& delegate, account::AccountInfo& owner, uint64_t amount) = 0;

  // Move `amount` units. `authority` is the source's owner or delegate; when
  // `authority_seeds` is set the authority is a program-derived address and
  // signs through the seeds instead of a signature.
  virtual void Transfer(account::AccountInfo& source, account::AccountInfo& destination, account::AccountInfo& authority,
                        const SignerSeeds* authority_seeds, uint64_t amount) = 0;

  // Issue `amount` new units of `mint` into `destination`. `authority` must be the mint authority.
  virtual void MintTo(account::AccountInfo& mint, account::AccountInfo& destination, account::AccountInfo& authority, const SignerSeeds* authority_seeds,
                      uint64_t amount) = 0;
};

} // namespace heroes::external
