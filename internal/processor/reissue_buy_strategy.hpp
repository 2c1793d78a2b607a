#pragma once

#include <string>
#include <utility>

#include "internal/processor/buy_strategy.hpp"

namespace heroes::processor {

struct ReissueOptions {
  model::Pubkey token_program_id;
  model::Pubkey metadata_program_id;
  std::string   retired_name{"RETIRED"};
  std::string   retired_uri{"retired://"};
};

/*
  Retires the sold asset and issues a replacement to the buyer.

  Accounts: old metadata, new mint, buyer token account for the new mint,
  program authority, token program, metadata program.

  1. rewrite the old asset's metadata to the retired state
  2. mint one unit of the new asset to the buyer
  3. buyer delegates the new unit to the authority

  The slot is rebound to the new mint.
*/
class ReissueBuyStrategy final : public BuyStrategy {
 public:
  explicit ReissueBuyStrategy(ReissueOptions options) : options_(std::move(options)) {
  }

  std::string_view name() const override {
    return "reissue";
  }

  model::Pubkey SettleAsset(BuyContext& context) override;

 private:
  ReissueOptions options_;
};

} // namespace heroes::processor
