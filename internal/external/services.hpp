#pragma once

namespace heroes::external {

class TokenService;
class PaymentService;
class MetadataService;

/*
  External services available to one instruction.

  metadata is only required by the reissue buy strategy.
*/
struct Services {
  TokenService*    token    = nullptr;
  PaymentService*  payment  = nullptr;
  MetadataService* metadata = nullptr;
};

} // namespace heroes::external
