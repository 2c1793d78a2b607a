#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "internal/account/account_info.hpp"
#include "internal/model/pubkey.hpp"

namespace heroes::host {

class AccountTransaction;

/*
  In-memory ledger account store.

  Committed state is only replaced by AccountTransaction::Commit. Committed
  data buffers are never written in place; transactions work on deep copies.
*/
class AccountStore {
 public:
  AccountStore();

  std::unique_ptr<AccountTransaction> Begin();

  // Single-account transactions for administration.
  // Create throws util::AlreadyExists, Get throws util::NotFound.
  void                  Create(const model::Pubkey& key, account::AccountState state);
  account::AccountState Get(const model::Pubkey& key) const;

  std::optional<account::AccountState> Find(const model::Pubkey& key) const;

  std::size_t size() const;

 private:
  friend class AccountTransaction;

  using State    = std::unordered_map<model::Pubkey, account::AccountState, model::PubkeyHash>;
  using Versions = std::unordered_map<model::Pubkey, uint64_t, model::PubkeyHash>;

  mutable std::mutex mutex_;
  State              committed_;
  Versions           versions_; // bumped on every commit that changes the account
};

} // namespace heroes::host
