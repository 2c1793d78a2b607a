#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/authority/program_authority.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/instruction_server.hpp"
#include "internal/host/account_store.hpp"
#include "internal/host/ledger_fixtures.hpp"
#include "internal/host/ledger_host.hpp"
#include "internal/observability/logging.hpp"
#include "internal/oracle/ownership_oracle.hpp"
#include "internal/processor/processor.hpp"
#include "internal/processor/reissue_buy_strategy.hpp"
#include "internal/processor/transfer_buy_strategy.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/instruction_service.hpp"
#include "internal/service/service_context.hpp"

namespace heroes::factory {

using heroes::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<processor::BuyStrategy> BuildBuyStrategy(const RuntimeConfig& config, const host::HostPrograms& programs) {
  const auto& program = config.program();
  switch (program.buy_strategy()) {
    case heroes::runtime::config::BUY_STRATEGY_REISSUE:
      return std::make_shared<processor::ReissueBuyStrategy>(
          processor::ReissueOptions{programs.token_program_id, programs.metadata_program_id, program.retired_name(), program.retired_uri()});
    case heroes::runtime::config::BUY_STRATEGY_TRANSFER:
    case heroes::runtime::config::BUY_STRATEGY_UNSPECIFIED:
      return std::make_shared<processor::TransferBuyStrategy>(programs.token_program_id);
    default:
      throw std::runtime_error("unsupported buy strategy");
  }
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Program
  // ------------------------------------------------------------------
  const auto         program_id = model::Pubkey::FromString(config.program().program_id());
  host::HostPrograms programs{model::Pubkey::FromString(config.host().token_program_id()), model::Pubkey::FromString(config.host().system_program_id()),
                              model::Pubkey::FromString(config.host().metadata_program_id())};

  auto authority    = authority::ProgramAuthority::Derive(program_id, config.program().authority_seed());
  auto buy_strategy = BuildBuyStrategy(config, programs);
  HEROES_LOG_INFO("program authority derived", {observability::KeyField("program_id", program_id), observability::KeyField("authority", authority.address()),
                                                observability::StringField("buy_strategy", buy_strategy->name())});

  auto processor = std::make_shared<const processor::Processor>(
      authority, oracle::OwnershipOracle(programs.token_program_id), buy_strategy,
      processor::ProcessorOptions{config.program().max_slots(), programs.system_program_id});

  // ------------------------------------------------------------------
  // Host
  // ------------------------------------------------------------------
  auto store = std::make_shared<host::AccountStore>();
  app.host   = std::make_shared<host::LedgerHost>(store, processor, programs);

  if (!config.host().repository_account().empty()) {
    const auto repository = model::Pubkey::FromString(config.host().repository_account());
    if (!store->Find(repository)) {
      store->Create(repository, host::MakeRepository(program_id, config.program().max_slots()));
      HEROES_LOG_INFO("repository account created",
                      {observability::KeyField("repository", repository), observability::IntField("max_slots", config.program().max_slots())});
    }
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.host              = app.host;
  ctx.max_slots         = config.program().max_slots();
  ctx.verify_signatures = !config.host().skip_signature_verification();
  if (!ctx.verify_signatures) {
    HEROES_LOG_WARN("signature verification disabled");
  }

  auto instruction_service = std::make_shared<service::InstructionService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::InstructionServer>(instruction_service));

  if (config.host().enable_admin()) {
    HEROES_LOG_WARN("admin service enabled");
    app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(std::make_shared<service::AdminService>(ctx)));
  }

  return app;
}

} // namespace heroes::factory
