#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace heroes::util {

/*
  Central error types.

  Program errors abort the whole instruction. The host rolls back every
  effect of an instruction that throws, and the gRPC layer translates these
  to status codes.
*/

enum class ErrorCode {
  // decoding
  InvalidInstruction,
  InvalidInstructionData,
  NotEnoughAccountKeys,

  // authorization
  MissingRequiredSignature,
  IncorrectProgramId,
  InvalidArgument,
  InvalidSeeds,

  // data integrity
  SlotOutOfRange,
  AccountDataTooSmall,
  InvalidAccountData,
  InvalidNFTKey,

  // external calls
  ExternalCallFailed,
  InsufficientFunds,
  OwnerMismatch,
  MintMismatch,
  AccountFrozen,
};

std::string_view ErrorCodeName(ErrorCode code);

class ProgramError : public std::runtime_error {
 public:
  ProgramError(ErrorCode code, const std::string& msg) : std::runtime_error(std::string(ErrorCodeName(code)) + ": " + msg), code_(code) {
  }

  ErrorCode code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

// Missing signer, wrong owning program, holder/asset mismatch.
class AuthorizationError : public ProgramError {
 public:
  AuthorizationError(ErrorCode code, const std::string& msg) : ProgramError(code, msg) {
  }
};

// Malformed instruction, slot out of range, stored asset key mismatch, malformed external record.
class DataIntegrityError : public ProgramError {
 public:
  DataIntegrityError(ErrorCode code, const std::string& msg) : ProgramError(code, msg) {
  }
};

// An external service rejected a request.
class ExternalCallFailure : public ProgramError {
 public:
  ExternalCallFailure(ErrorCode code, const std::string& msg) : ProgramError(code, msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidInstruction:
      return "InvalidInstruction";
    case ErrorCode::InvalidInstructionData:
      return "InvalidInstructionData";
    case ErrorCode::NotEnoughAccountKeys:
      return "NotEnoughAccountKeys";
    case ErrorCode::MissingRequiredSignature:
      return "MissingRequiredSignature";
    case ErrorCode::IncorrectProgramId:
      return "IncorrectProgramId";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::InvalidSeeds:
      return "InvalidSeeds";
    case ErrorCode::SlotOutOfRange:
      return "SlotOutOfRange";
    case ErrorCode::AccountDataTooSmall:
      return "AccountDataTooSmall";
    case ErrorCode::InvalidAccountData:
      return "InvalidAccountData";
    case ErrorCode::InvalidNFTKey:
      return "InvalidNFTKey";
    case ErrorCode::ExternalCallFailed:
      return "ExternalCallFailed";
    case ErrorCode::InsufficientFunds:
      return "InsufficientFunds";
    case ErrorCode::OwnerMismatch:
      return "OwnerMismatch";
    case ErrorCode::MintMismatch:
      return "MintMismatch";
    case ErrorCode::AccountFrozen:
      return "AccountFrozen";
  }
  return "Unknown";
}

} // namespace heroes::util
