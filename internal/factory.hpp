#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"

namespace heroes::host {
class LedgerHost;
}

namespace heroes::factory {

/*
  Application

  Owns everything the server needs for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<heroes::host::LedgerHost>     host;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root: derives the program authority, selects the buy strategy,
  creates the in-memory host and wires the gRPC services. The admin service
  is only served when host.enable_admin is set.
*/
Application Build(const heroes::runtime::config::RuntimeConfig& config);

} // namespace heroes::factory
