#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "internal/account/account_info.hpp"
#include "internal/authority/program_authority.hpp"
#include "internal/external/services.hpp"
#include "internal/instruction/instruction.hpp"
#include "internal/oracle/ownership_oracle.hpp"
#include "internal/processor/buy_strategy.hpp"

namespace heroes::processor {

struct ProcessorOptions {
  std::size_t   max_slots = 20;
  model::Pubkey system_program_id;
};

/*
  Hero registry instruction processor.

  Validates callers and accounts, consults the ownership oracle, drives the
  delegated-transfer coordinator and applies the add / update / buy
  transitions to the record repository.

  IMPORTANT:
  - Steps run strictly in order and every failure throws; the caller (the
    host) discards all effects of an instruction that throws.
  - Range and size checks happen before the first external call.
  - The processor holds no per-instruction state and may be shared.
*/
class Processor {
 public:
  Processor(authority::ProgramAuthority authority, oracle::OwnershipOracle oracle, std::shared_ptr<BuyStrategy> buy_strategy, ProcessorOptions options);

  void Process(std::vector<account::AccountInfo>& accounts, const uint8_t* data, std::size_t size, const external::Services& services) const;

  const model::Pubkey& program_id() const {
    return authority_.program_id();
  }
  const authority::ProgramAuthority& authority() const {
    return authority_;
  }
  const BuyStrategy& buy_strategy() const {
    return *buy_strategy_;
  }

 private:
  void AddRecord(account::AccountCursor& accounts, const instruction::AddRecordArgs& args, transfer::DelegatedTransferCoordinator& coordinator) const;

  void UpdateRecord(account::AccountCursor& accounts, const instruction::UpdateRecordArgs& args) const;

  void BuyRecord(account::AccountCursor& accounts, const instruction::BuyRecordArgs& args, transfer::DelegatedTransferCoordinator& coordinator,
                 external::PaymentService& payment) const;

  authority::ProgramAuthority  authority_;
  oracle::OwnershipOracle      oracle_;
  std::shared_ptr<BuyStrategy> buy_strategy_;
  ProcessorOptions             options_;
};

} // namespace heroes::processor
