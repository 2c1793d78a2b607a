#pragma once

#include <cstddef>
#include <memory>

namespace heroes::host {
class LedgerHost;
}

namespace heroes::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<heroes::host::LedgerHost> host;
  std::size_t                               max_slots         = 20;
  bool                                      verify_signatures = true;
};

} // namespace heroes::service
