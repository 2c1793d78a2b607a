#pragma once

#include "heroes/registry/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace heroes::service {

/*
  Account administration: seeds wallets, mints, token accounts, metadata and
  repositories into the host, mints tokens and reads accounts back.

  IMPORTANT:
  - Raw accounts are system-owned. Token, metadata and registry state is
    only created through its own template.
  - Mints and token accounts start empty. Balances come from MintTokens,
    which runs the token program's mint_to under the mint authority's
    signature.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  heroes::registry::v1::CreateAccountResponse CreateAccount(const heroes::registry::v1::CreateAccountRequest& req);

  heroes::registry::v1::GetAccountResponse GetAccount(const heroes::registry::v1::GetAccountRequest& req);

  heroes::registry::v1::MintTokensResponse MintTokens(const heroes::registry::v1::MintTokensRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace heroes::service
