#include "ledger_host.hpp"

#include <exception>
#include <string>

#include "internal/account/account_info.hpp"
#include "internal/external/services.hpp"
#include "internal/host/account_tx.hpp"
#include "internal/host/metadata_program.hpp"
#include "internal/host/system_program.hpp"
#include "internal/host/token_program.hpp"
#include "internal/observability/logging.hpp"
#include "internal/processor/processor.hpp"
#include "internal/util/errors.hpp"

namespace heroes::host {

using observability::IntField;
using observability::KeyField;
using observability::StringField;

LedgerHost::LedgerHost(std::shared_ptr<AccountStore> store, std::shared_ptr<const processor::Processor> processor, HostPrograms programs)
  : store_(std::move(store)), processor_(std::move(processor)), programs_(programs) {
  if (!store_ || !processor_) {
    throw util::InvalidState("ledger host requires an account store and a processor");
  }

  // Programs and the program authority are always addressable.
  EnsureAccount(programs_.system_program_id, programs_.system_program_id, true);
  EnsureAccount(programs_.token_program_id, programs_.system_program_id, true);
  EnsureAccount(programs_.metadata_program_id, programs_.system_program_id, true);
  EnsureAccount(processor_->program_id(), programs_.system_program_id, true);
  EnsureAccount(processor_->authority().address(), programs_.system_program_id, false);
}

void LedgerHost::EnsureAccount(const model::Pubkey& key, const model::Pubkey& owner, bool executable) {
  if (store_->Find(key)) return;
  store_->Create(key, account::AccountState{owner, 0, nullptr, executable});
}

EffectLog LedgerHost::Execute(const model::Pubkey& program_id, const std::vector<AccountMeta>& metas, const std::vector<uint8_t>& data) {
  std::scoped_lock lock(execute_mutex_);

  if (program_id != processor_->program_id()) {
    throw util::NotFound("program " + program_id.ToString() + " is not deployed");
  }

  auto tx = store_->Begin();
  try {
    std::vector<account::AccountInfo> accounts;
    accounts.reserve(metas.size());
    for (const auto& meta : metas) {
      accounts.push_back(account::AccountInfo{meta.key, meta.is_signer, meta.is_writable, &tx->Load(meta.key)});
    }

    const Invocation invocation{program_id, &tx->effects()};
    TokenProgram     token(programs_.token_program_id, invocation);
    SystemProgram    payment(programs_.system_program_id, invocation);
    MetadataProgram  metadata(programs_.metadata_program_id, invocation);

    processor_->Process(accounts, data.data(), data.size(), external::Services{&token, &payment, &metadata});

    for (const auto& meta : metas) {
      if (!tx->IsModified(meta.key)) continue;
      bool writable = false;
      for (const auto& other : metas) {
        if (other.key == meta.key && other.is_writable) writable = true;
      }
      if (!writable) {
        throw util::InvalidState("instruction modified read-only account " + meta.key.ToString());
      }
    }

    tx->Commit();
  } catch (const std::exception& ex) {
    HEROES_LOG_WARN("instruction rolled back", {KeyField("program_id", program_id), StringField("error", ex.what())});
    tx->Rollback();
    throw;
  }

  HEROES_LOG_INFO("instruction committed", {KeyField("program_id", program_id), IntField("effects", static_cast<std::int64_t>(tx->effects().size()))});
  return tx->effects();
}

EffectLog LedgerHost::MintTokens(const model::Pubkey& mint, const model::Pubkey& destination, const model::Pubkey& authority, uint64_t amount) {
  std::scoped_lock lock(execute_mutex_);

  auto tx = store_->Begin();
  try {
    account::AccountState authority_state{programs_.system_program_id, 0, nullptr, false};
    account::AccountInfo  mint_info{mint, false, true, &tx->Load(mint)};
    account::AccountInfo  destination_info{destination, false, true, &tx->Load(destination)};
    account::AccountInfo  authority_info{authority, true, false, &authority_state};

    TokenProgram token(programs_.token_program_id, Invocation{programs_.token_program_id, &tx->effects()});
    token.MintTo(mint_info, destination_info, authority_info, nullptr, amount);

    tx->Commit();
  } catch (const std::exception& ex) {
    HEROES_LOG_WARN("mint rolled back", {KeyField("mint", mint), StringField("error", ex.what())});
    tx->Rollback();
    throw;
  }

  HEROES_LOG_INFO("tokens minted", {KeyField("mint", mint), KeyField("destination", destination), IntField("amount", static_cast<std::int64_t>(amount))});
  return tx->effects();
}

} // namespace heroes::host
