#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace heroes::grpc {

AdminServer::AdminServer(std::shared_ptr<heroes::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::CreateAccount(::grpc::ServerContext*, const heroes::registry::v1::CreateAccountRequest* req,
                                          heroes::registry::v1::CreateAccountResponse* resp) {
  try {
    *resp = service_->CreateAccount(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetAccount(::grpc::ServerContext*, const heroes::registry::v1::GetAccountRequest* req,
                                       heroes::registry::v1::GetAccountResponse* resp) {
  try {
    *resp = service_->GetAccount(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::MintTokens(::grpc::ServerContext*, const heroes::registry::v1::MintTokensRequest* req,
                                       heroes::registry::v1::MintTokensResponse* resp) {
  try {
    *resp = service_->MintTokens(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace heroes::grpc
