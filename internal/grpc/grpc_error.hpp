#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace heroes::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    AuthorizationError                     PERMISSION_DENIED
    DataIntegrityError (decoding)          INVALID_ARGUMENT
    DataIntegrityError (other)             FAILED_PRECONDITION
    ExternalCallFailure                    ABORTED
    NotFound / AlreadyExists               NOT_FOUND / ALREADY_EXISTS
    InvalidState                           FAILED_PRECONDITION
    anything else                          INTERNAL
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace heroes::grpc
