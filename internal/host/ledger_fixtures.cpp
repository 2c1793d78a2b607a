#include "ledger_fixtures.hpp"

#include "internal/external/metadata_layout.hpp"
#include "internal/external/token_layout.hpp"
#include "internal/repository/record_repository.hpp"

namespace heroes::host {

account::AccountState MakeWallet(const model::Pubkey& system_program_id, uint64_t lamports) {
  return account::AccountState{system_program_id, lamports, account::AllocateAccountData(0), false};
}

account::AccountState MakeTokenAccount(const model::Pubkey& token_program_id, const model::Pubkey& mint, const model::Pubkey& holder, uint64_t amount) {
  external::TokenAccount token;
  token.mint   = mint;
  token.owner  = holder;
  token.amount = amount;
  token.state  = external::TokenAccountStatus::kInitialized;

  auto data = account::AllocateAccountData(external::kTokenAccountSize);
  external::PackTokenAccount(token, data->mutable_data());
  return account::AccountState{token_program_id, 0, data, false};
}

account::AccountState MakeMint(const model::Pubkey& token_program_id, std::optional<model::Pubkey> mint_authority, uint64_t supply) {
  external::Mint mint;
  mint.mint_authority = mint_authority;
  mint.supply         = supply;
  mint.is_initialized = true;

  auto data = account::AllocateAccountData(external::kMintSize);
  external::PackMint(mint, data->mutable_data());
  return account::AccountState{token_program_id, 0, data, false};
}

account::AccountState MakeMetadata(const model::Pubkey& metadata_program_id, const model::Pubkey& mint, const model::Pubkey& update_authority,
                                   const std::string& name, const std::string& uri) {
  auto data = account::AllocateAccountData(external::kMetadataSize);
  external::PackMetadata(external::AssetMetadata{mint, update_authority, name, uri}, data->mutable_data());
  return account::AccountState{metadata_program_id, 0, data, false};
}

account::AccountState MakeRepository(const model::Pubkey& program_id, std::size_t max_slots) {
  return account::AccountState{program_id, 0, account::AllocateAccountData(repository::RecordRepository::RequiredSize(max_slots)), false};
}

} // namespace heroes::host
