#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/account/account_info.hpp"
#include "internal/model/pubkey.hpp"

namespace heroes::host {

/*
  Builders for well-formed accounts, used by administration and tests.
*/

// System-owned wallet holding `lamports`.
account::AccountState MakeWallet(const model::Pubkey& system_program_id, uint64_t lamports);

// Initialized token account for `mint` owned by `holder`.
account::AccountState MakeTokenAccount(const model::Pubkey& token_program_id, const model::Pubkey& mint, const model::Pubkey& holder, uint64_t amount);

// Initialized zero-decimal mint.
account::AccountState MakeMint(const model::Pubkey& token_program_id, std::optional<model::Pubkey> mint_authority, uint64_t supply);

account::AccountState MakeMetadata(const model::Pubkey& metadata_program_id, const model::Pubkey& mint, const model::Pubkey& update_authority,
                                   const std::string& name, const std::string& uri);

// Zeroed repository owned by the ledger program, sized for `max_slots` records.
account::AccountState MakeRepository(const model::Pubkey& program_id, std::size_t max_slots);

} // namespace heroes::host
