#include "system_program.hpp"

#include <limits>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace heroes::host {

using util::ErrorCode;
using util::ExternalCallFailure;

void SystemProgram::Transfer(account::AccountInfo& source, account::AccountInfo& destination, uint64_t lamports) {
  RequireOwnedBy(source, program_id_, "payer");
  if (!source.is_signer) {
    throw ExternalCallFailure(ErrorCode::MissingRequiredSignature, "payer " + source.key.ToString() + " did not sign");
  }
  if (!source.is_writable || !destination.is_writable) {
    throw ExternalCallFailure(ErrorCode::ExternalCallFailed, "payment accounts must be writable");
  }
  if (source.state->lamports < lamports) {
    throw ExternalCallFailure(ErrorCode::InsufficientFunds,
                              "payer " + source.key.ToString() + " holds " + std::to_string(source.state->lamports) + " < " + std::to_string(lamports));
  }
  if (source.key != destination.key) {
    if (destination.state->lamports > std::numeric_limits<uint64_t>::max() - lamports) {
      throw ExternalCallFailure(ErrorCode::ExternalCallFailed, "lamport overflow");
    }
    source.state->lamports -= lamports;
    destination.state->lamports += lamports;
  }

  invocation_.Record(Effect{EffectKind::kPayment, source.key, destination.key, source.key, lamports, {}});
  HEROES_LOG_DEBUG("system transfer", {observability::KeyField("source", source.key), observability::KeyField("destination", destination.key),
                                       observability::IntField("lamports", static_cast<std::int64_t>(lamports))});
}

} // namespace heroes::host
