#pragma once

#include <cstdint>

#include "internal/account/account_info.hpp"

namespace heroes::external {

// Native currency transfers. `source` must sign.
class PaymentService {
 public:
  virtual ~PaymentService() = default;

  virtual void Transfer(account::AccountInfo& source, account::AccountInfo& destination, uint64_t lamports) = 0;
};

} // namespace heroes::external
