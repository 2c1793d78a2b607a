#include "transfer_buy_strategy.hpp"

#include "internal/processor/account_checks.hpp"

namespace heroes::processor {

model::Pubkey TransferBuyStrategy::SettleAsset(BuyContext& context) {
  auto& buyer_token_account = context.accounts.Next();
  auto& authority           = context.accounts.Next();
  auto& token_program       = context.accounts.Next();
  RequireProgram(token_program, token_program_id_, "token program");

  context.coordinator.TransferAsset(context.previous_token_account, buyer_token_account, authority);
  context.coordinator.GrantDelegate(buyer_token_account, context.buyer, authority);
  return context.asset_mint.key;
}

} // namespace heroes::processor
