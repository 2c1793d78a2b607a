#pragma once

#include <cstdint>
#include <unordered_map>

#include "internal/host/account_store.hpp"
#include "internal/host/effect.hpp"

namespace heroes::host {

/*
  Transaction = copy-on-load working set + effect log.

  Load deep-copies an account the first time it is touched, so the
  instruction mutates private buffers. Commit publishes the changed
  accounts if none of the loaded ones was committed by someone else since
  it was loaded and none of the created keys was taken; otherwise it throws
  util::InvalidState. The destructor rolls back an uncommitted transaction.

  References returned by Load stay valid for the transaction's lifetime.
*/
class AccountTransaction {
 public:
  explicit AccountTransaction(AccountStore& store);
  ~AccountTransaction();

  AccountTransaction(const AccountTransaction&)            = delete;
  AccountTransaction& operator=(const AccountTransaction&) = delete;

  // Throws util::NotFound when the account does not exist.
  account::AccountState& Load(const model::Pubkey& key);

  // Throws util::AlreadyExists when the key is taken.
  account::AccountState& Create(const model::Pubkey& key, account::AccountState state);

  // True when the loaded copy differs from the committed account.
  bool IsModified(const model::Pubkey& key) const;

  EffectLog& effects() {
    return effects_;
  }

  void Commit();
  void Rollback();
  bool IsCommitted() const {
    return committed_;
  }

 private:
  AccountStore&          store_;
  AccountStore::State    working_;
  AccountStore::State    originals_;
  AccountStore::Versions read_versions_;
  EffectLog              effects_;
  bool                   committed_   = false;
  bool                   rolled_back_ = false;
};

} // namespace heroes::host
