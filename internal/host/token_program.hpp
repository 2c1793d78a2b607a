#pragma once

#include "internal/external/token_service.hpp"
#include "internal/host/invocation.hpp"

namespace heroes::host {

/*
  In-memory token program over token and mint accounts it owns.

  Approve   owner signs and matches the source's owner
  Transfer  authority is the owner or a delegate with enough delegated units;
            the delegate is cleared once its allowance reaches zero
  MintTo    authority is the mint authority

  Frozen accounts reject every request. Failures throw
  util::ExternalCallFailure.
*/
class TokenProgram final : public external::TokenService {
 public:
  TokenProgram(model::Pubkey program_id, Invocation invocation) : program_id_(program_id), invocation_(invocation) {
  }

  void Approve(account::AccountInfo& source, const model::Pubkey& delegate, account::AccountInfo& owner, uint64_t amount) override;

  void Transfer(account::AccountInfo& source, account::AccountInfo& destination, account::AccountInfo& authority,
                const external::SignerSeeds* authority_seeds, uint64_t amount) override;

  void MintTo(account::AccountInfo& mint, account::AccountInfo& destination, account::AccountInfo& authority,
              const external::SignerSeeds* authority_seeds, uint64_t amount) override;

 private:
  model::Pubkey program_id_;
  Invocation    invocation_;
};

} // namespace heroes::host
