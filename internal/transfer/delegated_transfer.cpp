#include "delegated_transfer.hpp"

#include <exception>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace heroes::transfer {

namespace {

// Runs one external call and records its outcome.
template <typename Fn>
void Invoke(std::string_view call, Fn&& fn) {
  try {
    fn();
    observability::Metrics::Instance().RecordExternalCall(call, true);
  } catch (const std::exception& e) {
    observability::Metrics::Instance().RecordExternalCall(call, false);
    HEROES_LOG_WARN("external call failed", {observability::StringField("call", call), observability::StringField("error", e.what())});
    throw;
  }
}

} // namespace

DelegatedTransferCoordinator::DelegatedTransferCoordinator(const authority::ProgramAuthority& authority, external::TokenService& token,
                                                           external::MetadataService* metadata)
  : authority_(authority), token_(token), metadata_(metadata) {
}

void DelegatedTransferCoordinator::RequireAuthority(const account::AccountInfo& authority_account) const {
  if (authority_account.key != authority_.address()) {
    HEROES_LOG_WARN("authority account mismatch",
                    {observability::KeyField("expected", authority_.address()), observability::KeyField("presented", authority_account.key)});
    throw util::AuthorizationError(util::ErrorCode::InvalidSeeds, "presented authority " + authority_account.key.ToString() + " is not the program authority");
  }
}

void DelegatedTransferCoordinator::GrantDelegate(account::AccountInfo& token_account, account::AccountInfo& holder, const account::AccountInfo& authority_account) {
  RequireAuthority(authority_account);
  HEROES_LOG_INFO("granting delegate", {observability::KeyField("token_account", token_account.key), observability::KeyField("holder", holder.key)});
  Invoke("token.approve", [&] { token_.Approve(token_account, authority_.address(), holder, kAssetAmount); });
}

void DelegatedTransferCoordinator::TransferAsset(account::AccountInfo& from, account::AccountInfo& to, account::AccountInfo& authority_account) {
  RequireAuthority(authority_account);
  const auto seeds = authority_.Seeds();
  HEROES_LOG_INFO("transferring asset", {observability::KeyField("from", from.key), observability::KeyField("to", to.key)});
  Invoke("token.transfer", [&] { token_.Transfer(from, to, authority_account, &seeds, kAssetAmount); });
}

void DelegatedTransferCoordinator::IssueAsset(account::AccountInfo& mint, account::AccountInfo& to, account::AccountInfo& authority_account) {
  RequireAuthority(authority_account);
  const auto seeds = authority_.Seeds();
  HEROES_LOG_INFO("issuing asset", {observability::KeyField("mint", mint.key), observability::KeyField("to", to.key)});
  Invoke("token.mint_to", [&] { token_.MintTo(mint, to, authority_account, &seeds, kAssetAmount); });
}

void DelegatedTransferCoordinator::RetireAsset(account::AccountInfo& metadata, const model::Pubkey& mint, account::AccountInfo& authority_account,
                                               const std::string& retired_name, const std::string& retired_uri) {
  RequireAuthority(authority_account);
  if (!metadata_) {
    throw util::ExternalCallFailure(util::ErrorCode::ExternalCallFailed, "metadata service unavailable");
  }
  const auto seeds = authority_.Seeds();
  HEROES_LOG_INFO("retiring asset", {observability::KeyField("mint", mint), observability::KeyField("metadata", metadata.key)});
  Invoke("metadata.update", [&] { metadata_->Update(metadata, mint, authority_account, &seeds, retired_name, retired_uri); });
}

} // namespace heroes::transfer
