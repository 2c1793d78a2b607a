#include "invocation.hpp"

#include <string>
#include <utility>

#include "internal/authority/program_address.hpp"
#include "internal/util/errors.hpp"

namespace heroes::host {

using util::ErrorCode;
using util::ExternalCallFailure;

void Invocation::Record(Effect effect) const {
  if (effects) effects->push_back(std::move(effect));
}

void VerifyAuthority(const Invocation& invocation, const account::AccountInfo& authority, const external::SignerSeeds* seeds) {
  if (seeds) {
    const auto derived = authority::CreateProgramAddress(*seeds, invocation.caller_program_id);
    if (!derived || *derived != authority.key) {
      throw ExternalCallFailure(ErrorCode::MissingRequiredSignature, "seeds do not derive authority " + authority.key.ToString());
    }
    return;
  }
  if (!authority.is_signer) {
    throw ExternalCallFailure(ErrorCode::MissingRequiredSignature, "authority " + authority.key.ToString() + " did not sign");
  }
}

void RequireOwnedBy(const account::AccountInfo& account, const model::Pubkey& program_id, std::string_view what) {
  if (account.owner() != program_id) {
    throw ExternalCallFailure(ErrorCode::ExternalCallFailed, std::string(what) + " " + account.key.ToString() + " is not owned by " + program_id.ToString());
  }
}

uint8_t* WritableData(account::AccountInfo& account, std::size_t size) {
  if (!account.is_writable) {
    throw ExternalCallFailure(ErrorCode::ExternalCallFailed, "account " + account.key.ToString() + " is not writable");
  }
  if (account.data_size() != size || !account.state->data->is_mutable()) {
    throw ExternalCallFailure(ErrorCode::ExternalCallFailed, "account " + account.key.ToString() + " data cannot be rewritten");
  }
  return account.state->data->mutable_data();
}

} // namespace heroes::host
