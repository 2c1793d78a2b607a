#include <cassert>
#include <cstring>
#include <iostream>
#include <memory>

#include "internal/account/account_info.hpp"
#include "internal/host/account_store.hpp"
#include "internal/host/account_tx.hpp"
#include "internal/util/errors.hpp"

namespace {

using heroes::account::AccountState;
using heroes::host::AccountStore;
using heroes::model::Pubkey;

AccountState MakeState(uint64_t lamports, std::size_t size, uint8_t fill) {
  AccountState state{Pubkey::Generate(), lamports, heroes::account::AllocateAccountData(size), false};
  std::memset(state.data->mutable_data(), fill, size);
  return state;
}

void TestCreateGetFind() {
  AccountStore store;
  const auto   key = Pubkey::Generate();
  store.Create(key, MakeState(7, 4, 0xab));

  assert(store.size() == 1);
  const auto state = store.Get(key);
  assert(state.lamports == 7);
  assert(state.data->size() == 4 && state.data->data()[3] == 0xab);
  assert(!store.Find(Pubkey::Generate()).has_value());

  bool threw = false;
  try {
    store.Create(key, MakeState(1, 1, 0));
  } catch (const heroes::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw && "keys are unique");

  threw = false;
  try {
    (void)store.Get(Pubkey::Generate());
  } catch (const heroes::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestCreatedDataIsCopied() {
  AccountStore store;
  const auto   key   = Pubkey::Generate();
  auto         state = MakeState(0, 4, 0x01);
  store.Create(key, state);

  state.data->mutable_data()[0] = 0xff;
  assert(store.Get(key).data->data()[0] == 0x01);
}

void TestUncommittedChangesAreInvisible() {
  AccountStore store;
  const auto   key = Pubkey::Generate();
  store.Create(key, MakeState(10, 8, 0x00));

  auto  tx      = store.Begin();
  auto& working = tx->Load(key);
  working.lamports            = 99;
  working.data->mutable_data()[0] = 0x42;
  assert(tx->IsModified(key));

  assert(store.Get(key).lamports == 10);
  assert(store.Get(key).data->data()[0] == 0x00);

  tx->Commit();
  assert(store.Get(key).lamports == 99);
  assert(store.Get(key).data->data()[0] == 0x42);
}

void TestRollbackDiscardsEverything() {
  AccountStore store;
  const auto   key = Pubkey::Generate();
  store.Create(key, MakeState(10, 8, 0x00));

  {
    auto tx = store.Begin();
    tx->Load(key).data->mutable_data()[1] = 0x11;
    tx->Create(Pubkey::Generate(), MakeState(1, 1, 0));
    tx->Rollback();
  }
  {
    // dropped without commit
    auto tx = store.Begin();
    tx->Load(key).lamports = 0;
  }

  assert(store.size() == 1);
  assert(store.Get(key).lamports == 10);
  assert(store.Get(key).data->data()[1] == 0x00);
}

void TestUnchangedLoadIsNotModified() {
  AccountStore store;
  const auto   key = Pubkey::Generate();
  store.Create(key, MakeState(3, 16, 0x5a));

  auto tx = store.Begin();
  (void)tx->Load(key);
  assert(!tx->IsModified(key));
  assert(!tx->IsModified(Pubkey::Generate()));

  // loading twice hands out the same working copy
  tx->Load(key).lamports = 4;
  assert(tx->Load(key).lamports == 4);
  assert(tx->IsModified(key));
}

void TestConcurrentCommitConflicts() {
  AccountStore store;
  const auto   key = Pubkey::Generate();
  store.Create(key, MakeState(1, 1, 0));

  auto first  = store.Begin();
  auto second = store.Begin();
  first->Load(key).lamports  = 2;
  second->Load(key).lamports = 3;
  first->Commit();

  bool threw = false;
  try {
    second->Commit();
  } catch (const heroes::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "stale transaction must not overwrite a newer commit");
  assert(store.Get(key).lamports == 2);
}

void TestDisjointCommitsDoNotConflict() {
  AccountStore store;
  const auto   key = Pubkey::Generate();
  store.Create(key, MakeState(1, 1, 0));

  auto tx = store.Begin();
  tx->Load(key).lamports = 5;

  // an unrelated account and an unrelated update land in between
  const auto other = Pubkey::Generate();
  store.Create(other, MakeState(9, 1, 0));
  {
    auto side = store.Begin();
    side->Load(other).lamports = 10;
    side->Commit();
  }

  tx->Commit();
  assert(store.Get(key).lamports == 5);
  assert(store.Get(other).lamports == 10);
}

void TestReadOnlyLoadDoesNotBlockWriters() {
  AccountStore store;
  const auto   key = Pubkey::Generate();
  store.Create(key, MakeState(1, 1, 0));

  auto reader = store.Begin();
  (void)reader->Load(key);
  reader->Commit();

  auto writer = store.Begin();
  writer->Load(key).lamports = 2;
  writer->Commit();
  assert(store.Get(key).lamports == 2);
}

void TestCreateRaceConflicts() {
  AccountStore store;
  const auto   key = Pubkey::Generate();

  auto tx = store.Begin();
  tx->Create(key, MakeState(1, 1, 0x01));
  store.Create(key, MakeState(2, 1, 0x02));

  bool threw = false;
  try {
    tx->Commit();
  } catch (const heroes::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "a key created elsewhere must not be overwritten");
  assert(store.Get(key).lamports == 2);
}

void TestCommitTwiceFails() {
  AccountStore store;
  auto         tx = store.Begin();
  tx->Commit();
  assert(tx->IsCommitted());

  bool threw = false;
  try {
    tx->Commit();
  } catch (const heroes::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCreateGetFind();
  TestCreatedDataIsCopied();
  TestUncommittedChangesAreInvisible();
  TestRollbackDiscardsEverything();
  TestUnchangedLoadIsNotModified();
  TestConcurrentCommitConflicts();
  TestDisjointCommitsDoNotConflict();
  TestReadOnlyLoadDoesNotBlockWriters();
  TestCreateRaceConflicts();
  TestCommitTwiceFails();

  std::cout << "hero_registry_unit_account_store: pass\n";
  return 0;
}
