#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "heroes/registry/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace heroes::grpc {

class AdminServer final : public heroes::registry::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<heroes::service::AdminService> svc);

  ::grpc::Status CreateAccount(::grpc::ServerContext*, const heroes::registry::v1::CreateAccountRequest*,
                               heroes::registry::v1::CreateAccountResponse*) override;

  ::grpc::Status GetAccount(::grpc::ServerContext*, const heroes::registry::v1::GetAccountRequest*, heroes::registry::v1::GetAccountResponse*) override;

  ::grpc::Status MintTokens(::grpc::ServerContext*, const heroes::registry::v1::MintTokensRequest*, heroes::registry::v1::MintTokensResponse*) override;

 private:
  std::shared_ptr<heroes::service::AdminService> service_;
};

} // namespace heroes::grpc
