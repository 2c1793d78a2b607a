#pragma once

#include "heroes/registry/v1/instruction_service.pb.h"
#include "service_context.hpp"

namespace heroes::service {

/*
  Accepts signed ledger instructions and executes them on the host.

  Unless signature checks are disabled, every account meta marked signer
  needs a valid ed25519 signature over crypto::SigningMessage.
*/
class InstructionService {
 public:
  explicit InstructionService(ServiceContext ctx);

  heroes::registry::v1::SubmitInstructionResponse SubmitInstruction(const heroes::registry::v1::SubmitInstructionRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace heroes::service
