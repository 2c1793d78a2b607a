#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace heroes::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace heroes::util;

  if (dynamic_cast<const AuthorizationError*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (const auto* integrity = dynamic_cast<const DataIntegrityError*>(&e)) {
    switch (integrity->code()) {
      case ErrorCode::InvalidInstruction:
      case ErrorCode::InvalidInstructionData:
      case ErrorCode::NotEnoughAccountKeys:
        return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
      default:
        return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
    }
  }
  if (dynamic_cast<const ExternalCallFailure*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace heroes::grpc
