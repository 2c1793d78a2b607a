#include "reissue_buy_strategy.hpp"

#include "internal/processor/account_checks.hpp"
#include "internal/util/errors.hpp"

namespace heroes::processor {

model::Pubkey ReissueBuyStrategy::SettleAsset(BuyContext& context) {
  auto& old_metadata        = context.accounts.Next();
  auto& new_mint            = context.accounts.Next();
  auto& buyer_token_account = context.accounts.Next();
  auto& authority           = context.accounts.Next();
  auto& token_program       = context.accounts.Next();
  auto& metadata_program    = context.accounts.Next();
  RequireProgram(token_program, options_.token_program_id, "token program");
  RequireProgram(metadata_program, options_.metadata_program_id, "metadata program");

  if (new_mint.key == context.asset_mint.key) {
    throw util::DataIntegrityError(util::ErrorCode::InvalidAccountData, "replacement mint must differ from the retired asset");
  }

  context.coordinator.RetireAsset(old_metadata, context.asset_mint.key, authority, options_.retired_name, options_.retired_uri);
  context.coordinator.IssueAsset(new_mint, buyer_token_account, authority);
  context.coordinator.GrantDelegate(buyer_token_account, context.buyer, authority);
  return new_mint.key;
}

} // namespace heroes::processor
