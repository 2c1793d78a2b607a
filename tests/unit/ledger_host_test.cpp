#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

#include "internal/authority/program_authority.hpp"
#include "internal/external/metadata_layout.hpp"
#include "internal/external/token_layout.hpp"
#include "internal/host/account_store.hpp"
#include "internal/host/ledger_fixtures.hpp"
#include "internal/host/ledger_host.hpp"
#include "internal/instruction/instruction.hpp"
#include "internal/oracle/ownership_oracle.hpp"
#include "internal/processor/processor.hpp"
#include "internal/processor/reissue_buy_strategy.hpp"
#include "internal/processor/transfer_buy_strategy.hpp"
#include "internal/repository/record_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using heroes::host::AccountMeta;
using heroes::host::EffectKind;
using heroes::host::LedgerHost;
using heroes::model::Pubkey;

constexpr std::size_t kSlots = 20;

/*
  A host with one registry program, a seller holding asset A listed in
  slot 0, and a buyer.
*/
struct Ledger {
  explicit Ledger(bool reissue = false, uint64_t buyer_lamports = 1000)
    : authority(heroes::authority::ProgramAuthority::Derive(program_id, "hallofheros")), store(std::make_shared<heroes::host::AccountStore>()) {
    std::shared_ptr<heroes::processor::BuyStrategy> strategy;
    if (reissue) {
      strategy = std::make_shared<heroes::processor::ReissueBuyStrategy>(heroes::processor::ReissueOptions{token_program, metadata_program});
    } else {
      strategy = std::make_shared<heroes::processor::TransferBuyStrategy>(token_program);
    }
    auto processor = std::make_shared<const heroes::processor::Processor>(authority, heroes::oracle::OwnershipOracle(token_program), strategy,
                                                                          heroes::processor::ProcessorOptions{kSlots, system_program});
    host = std::make_unique<LedgerHost>(store, processor, heroes::host::HostPrograms{token_program, system_program, metadata_program});

    store->Create(repository, heroes::host::MakeRepository(program_id, kSlots));
    store->Create(seller, heroes::host::MakeWallet(system_program, 1000));
    store->Create(buyer, heroes::host::MakeWallet(system_program, buyer_lamports));
    store->Create(asset, heroes::host::MakeMint(token_program, std::nullopt, 1));
    store->Create(seller_tokens, heroes::host::MakeTokenAccount(token_program, asset, seller, 1));
    store->Create(buyer_tokens, heroes::host::MakeTokenAccount(token_program, asset, buyer, 0));
    store->Create(metadata, heroes::host::MakeMetadata(metadata_program, asset, authority.address(), "Hero #0", "ipfs://hero/0"));
    store->Create(new_asset, heroes::host::MakeMint(token_program, authority.address(), 0));
    store->Create(buyer_new_tokens, heroes::host::MakeTokenAccount(token_program, new_asset, buyer, 0));
  }

  heroes::host::EffectLog Submit(const heroes::instruction::HeroInstruction& instruction, const std::vector<AccountMeta>& metas) {
    return host->Execute(program_id, metas, heroes::instruction::PackInstruction(instruction));
  }

  std::vector<AccountMeta> AddMetas(bool repository_writable = true) {
    return {{seller, true, true},
            {repository, false, repository_writable},
            {seller_tokens, false, true},
            {authority.address(), false, false},
            {token_program, false, false}};
  }

  std::vector<AccountMeta> BuyMetas() {
    return {{buyer, true, true},
            {seller, false, true},
            {repository, false, true},
            {asset, false, false},
            {seller_tokens, false, true},
            {buyer_tokens, false, true},
            {authority.address(), false, false},
            {token_program, false, false},
            {system_program, false, false}};
  }

  std::vector<AccountMeta> ReissueMetas() {
    return {{buyer, true, true},
            {seller, false, true},
            {repository, false, true},
            {asset, false, false},
            {seller_tokens, false, true},
            {metadata, false, true},
            {new_asset, false, true},
            {buyer_new_tokens, false, true},
            {authority.address(), false, false},
            {token_program, false, false},
            {metadata_program, false, false},
            {system_program, false, false}};
  }

  void List() {
    Submit(heroes::instruction::AddRecordArgs{0, "ipfs://hero/0", asset.ToString(), 100, 150}, AddMetas());
  }

  heroes::external::TokenAccount Tokens(const Pubkey& key) {
    const auto state = store->Get(key);
    return heroes::external::UnpackTokenAccount(state.data->data(), static_cast<std::size_t>(state.data->size()));
  }

  heroes::model::HeroRecord Record(const Pubkey& key) {
    return heroes::repository::RecordRepository(store->Get(repository).data, kSlots).Read(0, key);
  }

  Pubkey program_id       = Pubkey::FromString("HeroRegistry1111111111111111111111111111111");
  Pubkey token_program    = Pubkey::FromString("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
  Pubkey system_program   = Pubkey::FromString("11111111111111111111111111111111");
  Pubkey metadata_program = Pubkey::FromString("metaqbxxUerdq28cj1RJV8D4S4HHHT8YZbYGFtwwQQS");

  heroes::authority::ProgramAuthority         authority;
  std::shared_ptr<heroes::host::AccountStore> store;
  std::unique_ptr<LedgerHost>                 host;

  Pubkey repository       = Pubkey::Generate();
  Pubkey seller           = Pubkey::Generate();
  Pubkey buyer            = Pubkey::Generate();
  Pubkey asset            = Pubkey::Generate();
  Pubkey seller_tokens    = Pubkey::Generate();
  Pubkey buyer_tokens     = Pubkey::Generate();
  Pubkey metadata         = Pubkey::Generate();
  Pubkey new_asset        = Pubkey::Generate();
  Pubkey buyer_new_tokens = Pubkey::Generate();
};

void TestHostMaterializesProgramAccounts() {
  Ledger ledger;
  assert(ledger.store->Get(ledger.token_program).executable);
  assert(ledger.store->Get(ledger.program_id).executable);
  assert(ledger.store->Find(ledger.authority.address()).has_value());
}

void TestAddDelegatesAssetToAuthority() {
  Ledger     ledger;
  const auto effects = ledger.Submit(heroes::instruction::AddRecordArgs{0, "ipfs://hero/0", ledger.asset.ToString(), 100, 150}, ledger.AddMetas());

  assert(effects.size() == 1);
  assert(effects[0].kind == EffectKind::kApprove);

  const auto tokens = ledger.Tokens(ledger.seller_tokens);
  assert(tokens.delegate && *tokens.delegate == ledger.authority.address());
  assert(tokens.delegated_amount == 1);

  const auto record = ledger.Record(ledger.asset);
  assert(record.last_price == 100 && record.listed_price == 150);
}

void TestBuyMovesAssetAndPayment() {
  Ledger ledger;
  ledger.List();

  const auto effects = ledger.Submit(heroes::instruction::BuyRecordArgs{0}, ledger.BuyMetas());
  assert(effects.size() == 3);
  assert(effects[0].kind == EffectKind::kTokenTransfer);
  assert(effects[1].kind == EffectKind::kApprove);
  assert(effects[2].kind == EffectKind::kPayment);
  assert(effects[2].amount == 150);

  const auto seller_tokens = ledger.Tokens(ledger.seller_tokens);
  const auto buyer_tokens  = ledger.Tokens(ledger.buyer_tokens);
  assert(seller_tokens.amount == 0);
  assert(!seller_tokens.delegate.has_value());
  assert(buyer_tokens.amount == 1);
  assert(buyer_tokens.delegate && *buyer_tokens.delegate == ledger.authority.address());

  assert(ledger.store->Get(ledger.buyer).lamports == 850);
  assert(ledger.store->Get(ledger.seller).lamports == 1150);

  const auto record = ledger.Record(ledger.asset);
  assert(record.last_price == 150);
  assert(record.listed_price == 150);
}

void TestPaymentFailureRollsBackTheSale() {
  Ledger ledger(false, 100);
  ledger.List();
  const auto repository_before = ledger.store->Get(ledger.repository).data;
  const auto record_before     = ledger.Record(ledger.asset);

  bool threw = false;
  try {
    ledger.Submit(heroes::instruction::BuyRecordArgs{0}, ledger.BuyMetas());
  } catch (const heroes::util::ExternalCallFailure& e) {
    threw = e.code() == heroes::util::ErrorCode::InsufficientFunds;
  }
  assert(threw && "buyer cannot cover the listed price");

  assert(ledger.Record(ledger.asset) == record_before);
  assert(ledger.store->Get(ledger.repository).data->Equals(*repository_before));
  assert(ledger.Tokens(ledger.seller_tokens).amount == 1);
  assert(ledger.Tokens(ledger.seller_tokens).delegate.has_value());
  assert(ledger.Tokens(ledger.buyer_tokens).amount == 0);
  assert(ledger.store->Get(ledger.buyer).lamports == 100);
  assert(ledger.store->Get(ledger.seller).lamports == 1000);
}

void TestReadOnlyRepositoryIsRejected() {
  Ledger ledger;

  bool threw = false;
  try {
    ledger.Submit(heroes::instruction::AddRecordArgs{0, "ipfs://hero/0", ledger.asset.ToString(), 100, 150}, ledger.AddMetas(false));
  } catch (const heroes::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "writes to accounts not marked writable are rejected");
  assert(!ledger.Tokens(ledger.seller_tokens).delegate.has_value());
}

void TestReissueRetiresOldAsset() {
  Ledger ledger(true);
  ledger.List();

  const auto effects = ledger.Submit(heroes::instruction::BuyRecordArgs{0}, ledger.ReissueMetas());
  assert(effects.size() == 4);
  assert(effects[0].kind == EffectKind::kMetadataUpdate);
  assert(effects[1].kind == EffectKind::kMintTo);
  assert(effects[2].kind == EffectKind::kApprove);
  assert(effects[3].kind == EffectKind::kPayment);

  const auto metadata_state = ledger.store->Get(ledger.metadata);
  const auto metadata = heroes::external::UnpackMetadata(metadata_state.data->data(), static_cast<std::size_t>(metadata_state.data->size()));
  assert(metadata.name == "RETIRED");
  assert(metadata.uri == "retired://");

  assert(ledger.Tokens(ledger.buyer_new_tokens).amount == 1);
  assert(ledger.Record(ledger.new_asset).last_price == 150);
  assert(ledger.store->Get(ledger.seller).lamports == 1150);
}

void TestUnknownProgramAndAccountAreNotFound() {
  Ledger ledger;

  bool threw = false;
  try {
    ledger.host->Execute(Pubkey::Generate(), ledger.AddMetas(), {2, 0});
  } catch (const heroes::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  auto metas   = ledger.AddMetas();
  metas[2].key = Pubkey::Generate();
  threw        = false;
  try {
    ledger.Submit(heroes::instruction::AddRecordArgs{0, "uri", ledger.asset.ToString(), 1, 2}, metas);
  } catch (const heroes::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestMintTokensChecksMintAuthority() {
  Ledger       ledger;
  const Pubkey minter      = Pubkey::Generate();
  const Pubkey coin        = Pubkey::Generate();
  const Pubkey coin_tokens = Pubkey::Generate();
  ledger.store->Create(coin, heroes::host::MakeMint(ledger.token_program, minter, 0));
  ledger.store->Create(coin_tokens, heroes::host::MakeTokenAccount(ledger.token_program, coin, ledger.buyer, 0));

  const auto effects = ledger.host->MintTokens(coin, coin_tokens, minter, 3);
  assert(effects.size() == 1 && effects[0].kind == EffectKind::kMintTo);
  assert(ledger.Tokens(coin_tokens).amount == 3);

  bool threw = false;
  try {
    ledger.host->MintTokens(coin, coin_tokens, ledger.seller, 5);
  } catch (const heroes::util::ExternalCallFailure& ex) {
    threw = ex.code() == heroes::util::ErrorCode::OwnerMismatch;
  }
  assert(threw && "only the mint authority can mint");
  assert(ledger.Tokens(coin_tokens).amount == 3);

  // the hero asset mint has a fixed supply
  threw = false;
  try {
    ledger.host->MintTokens(ledger.asset, ledger.seller_tokens, ledger.seller, 1);
  } catch (const heroes::util::ExternalCallFailure&) {
    threw = true;
  }
  assert(threw);
  assert(ledger.Tokens(ledger.seller_tokens).amount == 1);
}

} // namespace

int main() {
  TestHostMaterializesProgramAccounts();
  TestAddDelegatesAssetToAuthority();
  TestBuyMovesAssetAndPayment();
  TestPaymentFailureRollsBackTheSale();
  TestReadOnlyRepositoryIsRejected();
  TestReissueRetiresOldAsset();
  TestUnknownProgramAndAccountAreNotFound();
  TestMintTokensChecksMintAuthority();

  std::cout << "hero_registry_unit_ledger_host: pass\n";
  return 0;
}
