#include "instruction_service.hpp"

#include <unordered_map>
#include <vector>

#include "heroes/registry/v1/types.pb.h"
#include "internal/crypto/signature.hpp"
#include "internal/host/ledger_host.hpp"
#include "internal/service/observe.hpp"
#include "internal/service/wire.hpp"
#include "internal/util/errors.hpp"

namespace heroes::service {

using namespace heroes::registry::v1;

namespace {

void VerifySignatures(const SubmitInstructionRequest& req, const model::Pubkey& program_id, const std::vector<host::AccountMeta>& metas,
                      const std::vector<uint8_t>& data) {
  std::unordered_map<model::Pubkey, const SignerSignature*, model::PubkeyHash> by_key;
  for (const auto& signature : req.signatures()) {
    by_key[model::Pubkey::FromString(signature.pubkey())] = &signature;
  }

  const auto message = crypto::SigningMessage(program_id, metas, data);
  for (const auto& meta : metas) {
    if (!meta.is_signer) continue;

    auto it = by_key.find(meta.key);
    if (it == by_key.end()) {
      throw util::AuthorizationError(util::ErrorCode::MissingRequiredSignature, "no signature for signer " + meta.key.ToString());
    }
    VerifySignerSignature(meta.key, message, it->second->signature());
  }
}

} // namespace

InstructionService::InstructionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitInstructionResponse InstructionService::SubmitInstruction(const SubmitInstructionRequest& req) {
  return ObserveRpc("InstructionService.SubmitInstruction", [&] {
    const auto program_id = model::Pubkey::FromString(req.program_id());

    std::vector<host::AccountMeta> metas;
    metas.reserve(req.accounts_size());
    for (const auto& account : req.accounts()) {
      metas.push_back(host::AccountMeta{model::Pubkey::FromString(account.pubkey()), account.is_signer(), account.is_writable()});
    }
    const std::vector<uint8_t> data(req.data().begin(), req.data().end());

    if (ctx_.verify_signatures) {
      VerifySignatures(req, program_id, metas, data);
    }

    const auto effects = ctx_.host->Execute(program_id, metas, data);

    SubmitInstructionResponse resp;
    AppendEffects(effects, resp.mutable_effects());
    return resp;
  });
}

} // namespace heroes::service
