#pragma once

#include "internal/processor/buy_strategy.hpp"

namespace heroes::processor {

/*
  Moves the existing asset to the buyer.

  Accounts: buyer token account, program authority, token program.

  1. transfer one unit previous holder -> buyer, signed by the authority as delegate
  2. buyer re-delegates the unit to the authority for the next sale
*/
class TransferBuyStrategy final : public BuyStrategy {
 public:
  explicit TransferBuyStrategy(model::Pubkey token_program_id) : token_program_id_(token_program_id) {
  }

  std::string_view name() const override {
    return "transfer";
  }

  model::Pubkey SettleAsset(BuyContext& context) override;

 private:
  model::Pubkey token_program_id_;
};

} // namespace heroes::processor
