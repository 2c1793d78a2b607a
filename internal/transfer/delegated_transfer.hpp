#pragma once

#include <cstdint>
#include <string>

#include "internal/account/account_info.hpp"
#include "internal/authority/program_authority.hpp"
#include "internal/external/metadata_service.hpp"
#include "internal/external/token_service.hpp"

namespace heroes::transfer {

/*
  Delegated-Transfer Coordinator.

  Issues token and metadata requests on behalf of the program authority.
  The authority never holds assets; holders delegate a single unit to it and
  it signs later transfers through its seeds.

  Every method first checks that the presented authority account is the
  derived authority (util::AuthorizationError(InvalidSeeds) otherwise). Any
  failure from the external service propagates unchanged.
*/
class DelegatedTransferCoordinator {
 public:
  static constexpr uint64_t kAssetAmount = 1;

  DelegatedTransferCoordinator(const authority::ProgramAuthority& authority, external::TokenService& token, external::MetadataService* metadata = nullptr);

  // holder approves the authority for one unit held in token_account.
  void GrantDelegate(account::AccountInfo& token_account, account::AccountInfo& holder, const account::AccountInfo& authority_account);

  // One unit from -> to, signed by the authority as delegate.
  void TransferAsset(account::AccountInfo& from, account::AccountInfo& to, account::AccountInfo& authority_account);

  // One fresh unit of mint into `to`, signed by the authority as mint authority.
  void IssueAsset(account::AccountInfo& mint, account::AccountInfo& to, account::AccountInfo& authority_account);

  // Rewrites the metadata of `mint` to its terminal retired state.
  void RetireAsset(account::AccountInfo& metadata, const model::Pubkey& mint, account::AccountInfo& authority_account, const std::string& retired_name,
                   const std::string& retired_uri);

 private:
  void RequireAuthority(const account::AccountInfo& authority_account) const;

  const authority::ProgramAuthority& authority_;
  external::TokenService&            token_;
  external::MetadataService*         metadata_;
};

} // namespace heroes::transfer
