#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "heroes/registry/v1/instruction_service.grpc.pb.h"
#include "internal/service/instruction_service.hpp"

namespace heroes::grpc {

class InstructionServer final : public heroes::registry::v1::InstructionService::Service {
 public:
  explicit InstructionServer(std::shared_ptr<heroes::service::InstructionService> svc);

  ::grpc::Status SubmitInstruction(::grpc::ServerContext*, const heroes::registry::v1::SubmitInstructionRequest*,
                                   heroes::registry::v1::SubmitInstructionResponse*) override;

 private:
  std::shared_ptr<heroes::service::InstructionService> service_;
};

} // namespace heroes::grpc
