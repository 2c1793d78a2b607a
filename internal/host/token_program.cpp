#include "token_program.hpp"

#include <limits>
#include <string>

#include "internal/external/token_layout.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace heroes::host {

using external::TokenAccount;
using external::TokenAccountStatus;
using util::ErrorCode;
using util::ExternalCallFailure;

namespace {

TokenAccount LoadTokenAccount(const account::AccountInfo& account) {
  auto state = external::UnpackTokenAccount(account.data(), account.data_size());
  if (state.state == TokenAccountStatus::kUninitialized) {
    throw ExternalCallFailure(ErrorCode::ExternalCallFailed, "token account " + account.key.ToString() + " is not initialized");
  }
  if (state.state == TokenAccountStatus::kFrozen) {
    throw ExternalCallFailure(ErrorCode::AccountFrozen, "token account " + account.key.ToString() + " is frozen");
  }
  return state;
}

void StoreTokenAccount(account::AccountInfo& account, const TokenAccount& state) {
  external::PackTokenAccount(state, WritableData(account, external::kTokenAccountSize));
}

uint64_t CheckedAdd(uint64_t a, uint64_t b) {
  if (a > std::numeric_limits<uint64_t>::max() - b) {
    throw ExternalCallFailure(ErrorCode::ExternalCallFailed, "token amount overflow");
  }
  return a + b;
}

} // namespace

void TokenProgram::Approve(account::AccountInfo& source, const model::Pubkey& delegate, account::AccountInfo& owner, uint64_t amount) {
  RequireOwnedBy(source, program_id_, "token account");
  auto state = LoadTokenAccount(source);

  if (state.owner != owner.key) {
    throw ExternalCallFailure(ErrorCode::OwnerMismatch, owner.key.ToString() + " does not own token account " + source.key.ToString());
  }
  VerifyAuthority(invocation_, owner, nullptr);

  state.delegate         = delegate;
  state.delegated_amount = amount;
  StoreTokenAccount(source, state);

  invocation_.Record(Effect{EffectKind::kApprove, source.key, delegate, owner.key, amount, {}});
  HEROES_LOG_DEBUG("token approve", {observability::KeyField("source", source.key), observability::KeyField("delegate", delegate)});
}

void TokenProgram::Transfer(account::AccountInfo& source, account::AccountInfo& destination, account::AccountInfo& authority,
                            const external::SignerSeeds* authority_seeds, uint64_t amount) {
  RequireOwnedBy(source, program_id_, "token account");
  RequireOwnedBy(destination, program_id_, "token account");
  auto from = LoadTokenAccount(source);
  auto to   = LoadTokenAccount(destination);

  if (from.mint != to.mint) {
    throw ExternalCallFailure(ErrorCode::MintMismatch, "token accounts " + source.key.ToString() + " and " + destination.key.ToString() + " hold different mints");
  }

  if (authority.key == from.owner) {
    VerifyAuthority(invocation_, authority, authority_seeds);
  } else if (from.delegate && *from.delegate == authority.key) {
    VerifyAuthority(invocation_, authority, authority_seeds);
    if (from.delegated_amount < amount) {
      throw ExternalCallFailure(ErrorCode::InsufficientFunds, "delegate allowance " + std::to_string(from.delegated_amount) + " < " + std::to_string(amount));
    }
    from.delegated_amount -= amount;
    if (from.delegated_amount == 0) from.delegate.reset();
  } else {
    throw ExternalCallFailure(ErrorCode::OwnerMismatch, authority.key.ToString() + " is neither owner nor delegate of " + source.key.ToString());
  }

  if (from.amount < amount) {
    throw ExternalCallFailure(ErrorCode::InsufficientFunds, "token balance " + std::to_string(from.amount) + " < " + std::to_string(amount));
  }

  if (source.key == destination.key) {
    StoreTokenAccount(source, from);
  } else {
    from.amount -= amount;
    to.amount = CheckedAdd(to.amount, amount);
    StoreTokenAccount(source, from);
    StoreTokenAccount(destination, to);
  }

  invocation_.Record(Effect{EffectKind::kTokenTransfer, source.key, destination.key, authority.key, amount, {}});
  HEROES_LOG_DEBUG("token transfer", {observability::KeyField("source", source.key), observability::KeyField("destination", destination.key),
                                      observability::IntField("amount", static_cast<std::int64_t>(amount))});
}

void TokenProgram::MintTo(account::AccountInfo& mint, account::AccountInfo& destination, account::AccountInfo& authority,
                          const external::SignerSeeds* authority_seeds, uint64_t amount) {
  RequireOwnedBy(mint, program_id_, "mint");
  RequireOwnedBy(destination, program_id_, "token account");

  auto mint_state = external::UnpackMint(mint.data(), mint.data_size());
  if (!mint_state.is_initialized) {
    throw ExternalCallFailure(ErrorCode::ExternalCallFailed, "mint " + mint.key.ToString() + " is not initialized");
  }
  auto to = LoadTokenAccount(destination);
  if (to.mint != mint.key) {
    throw ExternalCallFailure(ErrorCode::MintMismatch, "token account " + destination.key.ToString() + " does not hold mint " + mint.key.ToString());
  }
  if (!mint_state.mint_authority) {
    throw ExternalCallFailure(ErrorCode::ExternalCallFailed, "mint " + mint.key.ToString() + " has a fixed supply");
  }
  if (*mint_state.mint_authority != authority.key) {
    throw ExternalCallFailure(ErrorCode::OwnerMismatch, authority.key.ToString() + " is not the mint authority of " + mint.key.ToString());
  }
  VerifyAuthority(invocation_, authority, authority_seeds);

  mint_state.supply = CheckedAdd(mint_state.supply, amount);
  to.amount         = CheckedAdd(to.amount, amount);
  external::PackMint(mint_state, WritableData(mint, external::kMintSize));
  StoreTokenAccount(destination, to);

  invocation_.Record(Effect{EffectKind::kMintTo, mint.key, destination.key, authority.key, amount, {}});
  HEROES_LOG_DEBUG("token mint_to", {observability::KeyField("mint", mint.key), observability::KeyField("destination", destination.key)});
}

} // namespace heroes::host
