#include "instruction_server.hpp"

#include "grpc_error.hpp"

namespace heroes::grpc {

InstructionServer::InstructionServer(std::shared_ptr<heroes::service::InstructionService> svc) : service_(std::move(svc)) {
}

::grpc::Status InstructionServer::SubmitInstruction(::grpc::ServerContext*, const heroes::registry::v1::SubmitInstructionRequest* req,
                                                    heroes::registry::v1::SubmitInstructionResponse* resp) {
  try {
    *resp = service_->SubmitInstruction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace heroes::grpc
