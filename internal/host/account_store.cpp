#include "account_store.hpp"

#include "internal/host/account_tx.hpp"
#include "internal/util/errors.hpp"

namespace heroes::host {

AccountStore::AccountStore() = default;

std::unique_ptr<AccountTransaction> AccountStore::Begin() {
  return std::make_unique<AccountTransaction>(*this);
}

void AccountStore::Create(const model::Pubkey& key, account::AccountState state) {
  auto tx = Begin();
  tx->Create(key, std::move(state));
  tx->Commit();
}

account::AccountState AccountStore::Get(const model::Pubkey& key) const {
  auto state = Find(key);
  if (!state) throw util::NotFound("account " + key.ToString() + " does not exist");
  return *state;
}

std::optional<account::AccountState> AccountStore::Find(const model::Pubkey& key) const {
  std::scoped_lock lock(mutex_);
  auto             it = committed_.find(key);
  if (it == committed_.end()) return std::nullopt;
  return it->second;
}

std::size_t AccountStore::size() const {
  std::scoped_lock lock(mutex_);
  return committed_.size();
}

} // namespace heroes::host
