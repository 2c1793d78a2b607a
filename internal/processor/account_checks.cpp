#include "account_checks.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace heroes::processor {

using observability::KeyField;
using observability::StringField;
using util::AuthorizationError;
using util::ErrorCode;

void RequireSigner(const account::AccountInfo& account, std::string_view role) {
  if (!account.is_signer) {
    HEROES_LOG_WARN("missing required signature", {StringField("role", role), KeyField("account", account.key)});
    throw AuthorizationError(ErrorCode::MissingRequiredSignature, std::string(role) + " " + account.key.ToString() + " did not sign");
  }
}

void RequireOwner(const account::AccountInfo& account, const model::Pubkey& owner, std::string_view role) {
  if (account.owner() != owner) {
    HEROES_LOG_WARN("account owned by another program", {StringField("role", role), KeyField("account", account.key), KeyField("owner", account.owner())});
    throw AuthorizationError(ErrorCode::IncorrectProgramId, std::string(role) + " " + account.key.ToString() + " is not owned by " + owner.ToString());
  }
}

void RequireProgram(const account::AccountInfo& account, const model::Pubkey& expected, std::string_view role) {
  if (account.key != expected) {
    HEROES_LOG_WARN("unexpected program account", {StringField("role", role), KeyField("expected", expected), KeyField("presented", account.key)});
    throw AuthorizationError(ErrorCode::IncorrectProgramId, std::string(role) + " " + account.key.ToString() + " is not " + expected.ToString());
  }
}

} // namespace heroes::processor
