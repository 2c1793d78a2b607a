#include "account_tx.hpp"

#include "internal/util/errors.hpp"

namespace heroes::host {

namespace {

bool SameData(const std::shared_ptr<arrow::Buffer>& a, const std::shared_ptr<arrow::Buffer>& b) {
  const int64_t a_size = a ? a->size() : 0;
  const int64_t b_size = b ? b->size() : 0;
  if (a_size != b_size) return false;
  if (a_size == 0) return true;
  return a->Equals(*b);
}

template <class Versions>
uint64_t VersionOf(const Versions& versions, const model::Pubkey& key) {
  auto it = versions.find(key);
  return it == versions.end() ? 0 : it->second;
}

} // namespace

AccountTransaction::AccountTransaction(AccountStore& store) : store_(store) {
}

AccountTransaction::~AccountTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

account::AccountState& AccountTransaction::Load(const model::Pubkey& key) {
  if (auto it = working_.find(key); it != working_.end()) return it->second;

  std::scoped_lock lock(store_.mutex_);
  auto             it = store_.committed_.find(key);
  if (it == store_.committed_.end()) {
    throw util::NotFound("account " + key.ToString() + " does not exist");
  }

  originals_.emplace(key, it->second);
  read_versions_[key] = VersionOf(store_.versions_, key);
  auto copy = it->second;
  copy.data = account::CopyAccountData(it->second.data);
  return working_.emplace(key, std::move(copy)).first->second;
}

account::AccountState& AccountTransaction::Create(const model::Pubkey& key, account::AccountState state) {
  std::scoped_lock lock(store_.mutex_);
  if (working_.contains(key) || store_.committed_.contains(key)) {
    throw util::AlreadyExists("account " + key.ToString() + " already exists");
  }
  state.data = account::CopyAccountData(state.data);
  return working_.emplace(key, std::move(state)).first->second;
}

bool AccountTransaction::IsModified(const model::Pubkey& key) const {
  auto current = working_.find(key);
  if (current == working_.end()) return false;

  auto original = originals_.find(key);
  if (original == originals_.end()) return true;

  const auto& before = original->second;
  const auto& after  = current->second;
  return before.owner != after.owner || before.lamports != after.lamports || before.executable != after.executable || !SameData(before.data, after.data);
}

void AccountTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw util::InvalidState("transaction already finished");
  }

  std::scoped_lock lock(store_.mutex_);
  for (const auto& [key, version] : read_versions_) {
    if (VersionOf(store_.versions_, key) != version) {
      throw util::InvalidState("transaction conflict: account " + key.ToString() + " was modified by a concurrent transaction");
    }
  }
  for (const auto& [key, state] : working_) {
    if (!originals_.contains(key) && store_.committed_.contains(key)) {
      throw util::InvalidState("transaction conflict: account " + key.ToString() + " was created by a concurrent transaction");
    }
  }

  for (auto& [key, state] : working_) {
    if (originals_.contains(key) && !IsModified(key)) continue;
    store_.committed_[key] = std::move(state);
    store_.versions_[key]++;
  }
  working_.clear();
  originals_.clear();
  read_versions_.clear();
  committed_ = true;
}

void AccountTransaction::Rollback() {
  working_.clear();
  originals_.clear();
  read_versions_.clear();
  effects_.clear();
  rolled_back_ = true;
}

} // namespace heroes::host
