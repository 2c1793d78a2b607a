#include "admin_service.hpp"

#include <algorithm>
#include <optional>
#include <string>

#include "heroes/registry/v1/types.pb.h"
#include "internal/crypto/signature.hpp"
#include "internal/host/ledger_fixtures.hpp"
#include "internal/host/ledger_host.hpp"
#include "internal/observability/logging.hpp"
#include "internal/processor/processor.hpp"
#include "internal/service/observe.hpp"
#include "internal/service/wire.hpp"
#include "internal/util/errors.hpp"

namespace heroes::service {

using namespace heroes::registry::v1;

namespace {

model::Pubkey RequiredKey(const std::string& value, const char* field) {
  if (value.empty()) {
    throw util::InvalidState(std::string(field) + " is required");
  }
  return model::Pubkey::FromString(value);
}

// Balances only come from the token program's mint_to.
void RequireEmpty(uint64_t amount, const char* what) {
  if (amount != 0) {
    throw util::InvalidState(std::string("create account: ") + what + " must start at zero, use MintTokens");
  }
}

void FillAccount(const model::Pubkey& key, const account::AccountState& state, Account* out) {
  out->set_pubkey(key.ToString());
  out->set_owner(state.owner.ToString());
  out->set_lamports(state.lamports);
  if (state.data) {
    out->set_data(reinterpret_cast<const char*>(state.data->data()), static_cast<std::size_t>(state.data->size()));
  }
  out->set_executable(state.executable);
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateAccountResponse AdminService::CreateAccount(const CreateAccountRequest& req) {
  return ObserveRpc("AdminService.CreateAccount", [&] {
    const auto& programs = ctx_.host->programs();
    const auto  key      = req.pubkey().empty() ? model::Pubkey::Generate() : model::Pubkey::FromString(req.pubkey());

    account::AccountState state;
    switch (req.account_template()) {
      case ACCOUNT_TEMPLATE_RAW: {
        // program-owned data is only ever written by its program
        state.owner = req.owner().empty() ? programs.system_program_id : model::Pubkey::FromString(req.owner());
        if (state.owner != programs.system_program_id) {
          throw util::AuthorizationError(util::ErrorCode::IncorrectProgramId, "raw accounts must be owned by the system program, not " + state.owner.ToString());
        }
        state.lamports = req.lamports();
        state.data     = account::AllocateAccountData(req.data().size());
        std::copy(req.data().begin(), req.data().end(), state.data->mutable_data());
        break;
      }
      case ACCOUNT_TEMPLATE_WALLET:
        state = host::MakeWallet(programs.system_program_id, req.lamports());
        break;
      case ACCOUNT_TEMPLATE_MINT: {
        RequireEmpty(req.amount(), "mint supply");
        std::optional<model::Pubkey> authority;
        if (!req.authority().empty()) authority = model::Pubkey::FromString(req.authority());
        state = host::MakeMint(programs.token_program_id, authority, 0);
        break;
      }
      case ACCOUNT_TEMPLATE_TOKEN_ACCOUNT:
        RequireEmpty(req.amount(), "token balance");
        state = host::MakeTokenAccount(programs.token_program_id, RequiredKey(req.mint(), "mint"), RequiredKey(req.holder(), "holder"), 0);
        break;
      case ACCOUNT_TEMPLATE_METADATA:
        state = host::MakeMetadata(programs.metadata_program_id, RequiredKey(req.mint(), "mint"), RequiredKey(req.authority(), "authority"), req.name(),
                                   req.uri());
        break;
      case ACCOUNT_TEMPLATE_REPOSITORY:
        state = host::MakeRepository(ctx_.host->processor().program_id(), ctx_.max_slots);
        break;
      default:
        throw util::InvalidState("create account: account_template is required");
    }

    ctx_.host->store().Create(key, state);
    HEROES_LOG_INFO("account created", {observability::KeyField("pubkey", key), observability::KeyField("owner", state.owner)});

    CreateAccountResponse resp;
    FillAccount(key, ctx_.host->store().Get(key), resp.mutable_account());
    return resp;
  });
}

GetAccountResponse AdminService::GetAccount(const GetAccountRequest& req) {
  return ObserveRpc("AdminService.GetAccount", [&] {
    const auto key = model::Pubkey::FromString(req.pubkey());

    GetAccountResponse resp;
    FillAccount(key, ctx_.host->store().Get(key), resp.mutable_account());
    return resp;
  });
}

MintTokensResponse AdminService::MintTokens(const MintTokensRequest& req) {
  return ObserveRpc("AdminService.MintTokens", [&] {
    const auto mint        = model::Pubkey::FromString(req.mint());
    const auto destination = model::Pubkey::FromString(req.destination());
    const auto authority   = RequiredKey(req.authority().pubkey(), "authority");

    if (ctx_.verify_signatures) {
      const auto message = crypto::MintToMessage(ctx_.host->programs().token_program_id, mint, destination, authority, req.amount());
      VerifySignerSignature(authority, message, req.authority().signature());
    }

    MintTokensResponse resp;
    AppendEffects(ctx_.host->MintTokens(mint, destination, authority, req.amount()), resp.mutable_effects());
    return resp;
  });
}

} // namespace heroes::service
