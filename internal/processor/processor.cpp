#include "processor.hpp"

#include <chrono>
#include <string>
#include <string_view>

#include "internal/external/payment_service.hpp"
#include "internal/external/token_service.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/processor/account_checks.hpp"
#include "internal/repository/record_repository.hpp"
#include "internal/transfer/delegated_transfer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/overloaded.hpp"

namespace heroes::processor {

using observability::IntField;
using observability::KeyField;
using observability::StringField;

Processor::Processor(authority::ProgramAuthority authority, oracle::OwnershipOracle oracle, std::shared_ptr<BuyStrategy> buy_strategy,
                     ProcessorOptions options)
  : authority_(std::move(authority)), oracle_(std::move(oracle)), buy_strategy_(std::move(buy_strategy)), options_(options) {
  if (!buy_strategy_) {
    throw util::InvalidState("processor requires a buy strategy");
  }
}

void Processor::Process(std::vector<account::AccountInfo>& accounts, const uint8_t* data, std::size_t size, const external::Services& services) const {
  std::string_view op = "unknown";

  observability::SpanScope span("hero_registry.instruction");
  const auto               started_at = std::chrono::steady_clock::now();
  auto                     elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };

  try {
    const auto instruction = instruction::UnpackInstruction(data, size);
    op                     = instruction::InstructionName(instruction);
    span.SetAttribute("op", op);

    if (!services.token || !services.payment) {
      throw util::InvalidState("token and payment services are required");
    }
    transfer::DelegatedTransferCoordinator coordinator(authority_, *services.token, services.metadata);
    account::AccountCursor                 cursor(accounts);

    std::visit(util::Overloaded{
                   [&](const instruction::AddRecordArgs& args) { AddRecord(cursor, args, coordinator); },
                   [&](const instruction::UpdateRecordArgs& args) { UpdateRecord(cursor, args); },
                   [&](const instruction::BuyRecordArgs& args) { BuyRecord(cursor, args, coordinator, *services.payment); },
               },
               instruction);

    observability::Metrics::Instance().RecordInstruction(op, true);
    observability::Metrics::Instance().ObserveInstructionLatencyMs(op, elapsed_ms());
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    HEROES_LOG_WARN("instruction rejected", {StringField("op", op), StringField("error", ex.what())});
    observability::Metrics::Instance().RecordInstruction(op, false);
    observability::Metrics::Instance().ObserveInstructionLatencyMs(op, elapsed_ms());
    throw;
  }
}

void Processor::AddRecord(account::AccountCursor& accounts, const instruction::AddRecordArgs& args, transfer::DelegatedTransferCoordinator& coordinator) const {
  auto& adder         = accounts.Next();
  auto& repository    = accounts.Next();
  auto& token_account = accounts.Next();
  auto& authority     = accounts.Next();
  auto& token_program = accounts.Next();

  HEROES_LOG_INFO("add record", {IntField("hero_id", args.hero_id), KeyField("adder", adder.key), StringField("key_nft", args.key_nft)});

  RequireSigner(adder, "adder");
  RequireOwner(repository, program_id(), "repository");
  const auto key_nft = model::Pubkey::FromString(args.key_nft);

  repository::RecordRepository records(repository.state->data, options_.max_slots);
  records.CheckSlot(args.hero_id);

  RequireProgram(token_program, oracle_.token_program_id(), "token program");
  oracle_.RequireHolder(token_account, adder.key, key_nft);
  coordinator.GrantDelegate(token_account, adder, authority);

  records.Write(model::HeroRecord{args.hero_id, args.content_uri, key_nft, args.last_price, args.listed_price});
  HEROES_LOG_INFO("record added", {IntField("hero_id", args.hero_id), KeyField("key_nft", key_nft)});
}

void Processor::UpdateRecord(account::AccountCursor& accounts, const instruction::UpdateRecordArgs& args) const {
  auto& setter        = accounts.Next();
  auto& repository    = accounts.Next();
  auto& asset_mint    = accounts.Next();
  auto& token_account = accounts.Next();

  HEROES_LOG_INFO("update record", {IntField("hero_id", args.hero_id), KeyField("setter", setter.key), KeyField("key_nft", args.key_nft)});

  RequireSigner(setter, "setter");
  RequireOwner(repository, program_id(), "repository");
  if (asset_mint.key != args.key_nft) {
    throw util::DataIntegrityError(util::ErrorCode::InvalidNFTKey, "mint account " + asset_mint.key.ToString() + " is not " + args.key_nft.ToString());
  }

  oracle_.RequireHolder(token_account, setter.key, args.key_nft);

  repository::RecordRepository records(repository.state->data, options_.max_slots);
  auto                         record = records.Read(args.hero_id, args.key_nft);
  record.listed_price                 = args.new_price;
  record.content_uri                  = args.content_uri;
  records.Write(record);

  HEROES_LOG_INFO("record updated", {IntField("hero_id", args.hero_id), IntField("listed_price", static_cast<std::int64_t>(args.new_price))});
}

void Processor::BuyRecord(account::AccountCursor& accounts, const instruction::BuyRecordArgs& args, transfer::DelegatedTransferCoordinator& coordinator,
                          external::PaymentService& payment) const {
  auto& buyer                  = accounts.Next();
  auto& previous_holder        = accounts.Next();
  auto& repository             = accounts.Next();
  auto& asset_mint             = accounts.Next();
  auto& previous_token_account = accounts.Next();

  HEROES_LOG_INFO("buy record", {IntField("hero_id", args.hero_id), KeyField("buyer", buyer.key), KeyField("previous_holder", previous_holder.key),
                                 StringField("strategy", buy_strategy_->name())});

  RequireSigner(buyer, "buyer");
  RequireOwner(repository, program_id(), "repository");

  repository::RecordRepository records(repository.state->data, options_.max_slots);
  records.CheckSlot(args.hero_id);

  oracle_.RequireHolder(previous_token_account, previous_holder.key, asset_mint.key);

  BuyContext context{buyer, previous_holder, asset_mint, previous_token_account, accounts, coordinator};
  const auto settled_asset = buy_strategy_->SettleAsset(context);

  auto record         = records.Read(args.hero_id, asset_mint.key);
  record.last_price   = record.listed_price;
  record.key_nft      = settled_asset;
  records.Write(record);

  auto& system_program = accounts.Next();
  RequireProgram(system_program, options_.system_program_id, "system program");

  HEROES_LOG_INFO("paying previous holder", {KeyField("from", buyer.key), KeyField("to", previous_holder.key),
                                             IntField("lamports", static_cast<std::int64_t>(record.last_price))});
  try {
    payment.Transfer(buyer, previous_holder, record.last_price);
    observability::Metrics::Instance().RecordExternalCall("system.transfer", true);
  } catch (const std::exception&) {
    observability::Metrics::Instance().RecordExternalCall("system.transfer", false);
    throw;
  }

  HEROES_LOG_INFO("record sold", {IntField("hero_id", args.hero_id), KeyField("key_nft", record.key_nft),
                                  IntField("last_price", static_cast<std::int64_t>(record.last_price))});
}

} // namespace heroes::processor
