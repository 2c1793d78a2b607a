#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "internal/host/account_meta.hpp"
#include "internal/host/account_store.hpp"
#include "internal/host/effect.hpp"
#include "internal/model/pubkey.hpp"

namespace heroes::processor {
class Processor;
}

namespace heroes::host {

struct HostPrograms {
  model::Pubkey token_program_id;
  model::Pubkey system_program_id;
  model::Pubkey metadata_program_id;
};

/*
  Runs ledger instructions against the account store.

  Each Execute is one transaction:
    1. load the listed accounts into a private working set
    2. run the processor with token, payment and metadata programs bound
       to that working set
    3. reject changes to accounts no meta marked writable
    4. commit and return the effect log

  Any exception rolls the whole instruction back. Instructions execute one
  at a time.
*/
class LedgerHost {
 public:
  LedgerHost(std::shared_ptr<AccountStore> store, std::shared_ptr<const processor::Processor> processor, HostPrograms programs);

  // Throws util::NotFound for an unknown program or account, util::InvalidState
  // for a read-only violation or commit conflict, and whatever the processor throws.
  EffectLog Execute(const model::Pubkey& program_id, const std::vector<AccountMeta>& metas, const std::vector<uint8_t>& data);

  // Token program mint_to signed by `authority`, in its own transaction.
  // The caller has already authenticated `authority`. Throws util::NotFound
  // for an unknown mint or destination and util::ExternalCallFailure when the
  // token program rejects the request.
  EffectLog MintTokens(const model::Pubkey& mint, const model::Pubkey& destination, const model::Pubkey& authority, uint64_t amount);

  AccountStore& store() {
    return *store_;
  }
  const HostPrograms& programs() const {
    return programs_;
  }
  const processor::Processor& processor() const {
    return *processor_;
  }

 private:
  void EnsureAccount(const model::Pubkey& key, const model::Pubkey& owner, bool executable);

  std::shared_ptr<AccountStore>               store_;
  std::shared_ptr<const processor::Processor> processor_;
  HostPrograms                                programs_;
  std::mutex                                  execute_mutex_;
};

} // namespace heroes::host
