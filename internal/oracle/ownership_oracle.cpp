#include "ownership_oracle.hpp"

#include "internal/external/token_layout.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace heroes::oracle {

using observability::KeyField;
using util::ErrorCode;

Holding OwnershipOracle::CurrentHolder(const account::AccountInfo& token_account) const {
  if (token_account.owner() != token_program_id_) {
    throw util::AuthorizationError(ErrorCode::IncorrectProgramId, "token account " + token_account.key.ToString() + " is not owned by the token program");
  }

  const auto state = external::UnpackTokenAccount(token_account.data(), token_account.data_size());
  if (state.state == external::TokenAccountStatus::kUninitialized) {
    throw util::DataIntegrityError(ErrorCode::InvalidAccountData, "token account " + token_account.key.ToString() + " is not initialized");
  }

  return Holding{state.owner, state.mint, state.amount};
}

Holding OwnershipOracle::RequireHolder(const account::AccountInfo& token_account, const model::Pubkey& holder, const model::Pubkey& asset) const {
  auto holding = CurrentHolder(token_account);
  if (holding.holder != holder || holding.asset != asset || holding.amount < 1) {
    HEROES_LOG_WARN("NFT is not owned by presented holder",
                    {KeyField("token_account", token_account.key), KeyField("expected_holder", holder), KeyField("actual_holder", holding.holder),
                     KeyField("expected_asset", asset), KeyField("actual_asset", holding.asset)});
    throw util::AuthorizationError(ErrorCode::InvalidArgument, holder.ToString() + " does not hold asset " + asset.ToString());
  }
  return holding;
}

} // namespace heroes::oracle
