#pragma once

#include "internal/model/pubkey.hpp"

namespace heroes::host {

// An account reference in a submitted instruction, with the caller's asserted flags.
struct AccountMeta {
  model::Pubkey key;
  bool          is_signer   = false;
  bool          is_writable = false;
};

} // namespace heroes::host
