#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/pubkey.hpp"

namespace heroes::host {

enum class EffectKind {
  kApprove,
  kTokenTransfer,
  kMintTo,
  kPayment,
  kMetadataUpdate,
};

/*
  One completed external call, in execution order.

  Effects of a rolled back instruction are discarded with it.
*/
struct Effect {
  EffectKind    kind = EffectKind::kApprove;
  model::Pubkey source;
  model::Pubkey destination;
  model::Pubkey authority;
  uint64_t      amount = 0;
  std::string   detail;
};

using EffectLog = std::vector<Effect>;

inline std::string_view EffectKindName(EffectKind kind) {
  switch (kind) {
    case EffectKind::kApprove:
      return "approve";
    case EffectKind::kTokenTransfer:
      return "token_transfer";
    case EffectKind::kMintTo:
      return "mint_to";
    case EffectKind::kPayment:
      return "payment";
    case EffectKind::kMetadataUpdate:
      return "metadata_update";
  }
  return "unknown";
}

} // namespace heroes::host
