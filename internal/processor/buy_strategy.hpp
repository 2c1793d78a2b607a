#pragma once

#include <string_view>

#include "internal/account/account_info.hpp"
#include "internal/model/pubkey.hpp"
#include "internal/transfer/delegated_transfer.hpp"

namespace heroes::processor {

/*
  Accounts and collaborators shared with the buy strategy.

  `accounts` is positioned just after the previous holder's token account;
  the strategy consumes its own accounts from there, in its documented order.
*/
struct BuyContext {
  account::AccountInfo&                   buyer;
  account::AccountInfo&                   previous_holder;
  account::AccountInfo&                   asset_mint;
  account::AccountInfo&                   previous_token_account;
  account::AccountCursor&                 accounts;
  transfer::DelegatedTransferCoordinator& coordinator;
};

/*
  How a sold asset reaches the buyer.

  SettleAsset runs the strategy's external calls in order and returns the
  asset key the slot must track once the sale completes. Any failure
  propagates and aborts the instruction.
*/
class BuyStrategy {
 public:
  virtual ~BuyStrategy() = default;

  virtual std::string_view name() const = 0;

  virtual model::Pubkey SettleAsset(BuyContext& context) = 0;
};

} // namespace heroes::processor
