#pragma once

#include "internal/external/payment_service.hpp"
#include "internal/host/invocation.hpp"

namespace heroes::host {

// Native lamport transfers between system-owned wallets.
class SystemProgram final : public external::PaymentService {
 public:
  SystemProgram(model::Pubkey program_id, Invocation invocation) : program_id_(program_id), invocation_(invocation) {
  }

  void Transfer(account::AccountInfo& source, account::AccountInfo& destination, uint64_t lamports) override;

 private:
  model::Pubkey program_id_;
  Invocation    invocation_;
};

} // namespace heroes::host
