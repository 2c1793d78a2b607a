#pragma once

#include <string_view>

#include "internal/account/account_info.hpp"
#include "internal/model/pubkey.hpp"

namespace heroes::processor {

// AuthorizationError(MissingRequiredSignature) unless the account signed.
void RequireSigner(const account::AccountInfo& account, std::string_view role);

// AuthorizationError(IncorrectProgramId) unless `account` is owned by `owner`.
void RequireOwner(const account::AccountInfo& account, const model::Pubkey& owner, std::string_view role);

// AuthorizationError(IncorrectProgramId) unless `account` is the program `expected`.
void RequireProgram(const account::AccountInfo& account, const model::Pubkey& expected, std::string_view role);

} // namespace heroes::processor
