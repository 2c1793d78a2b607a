#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "internal/external/signer_seeds.hpp"
#include "internal/model/pubkey.hpp"

namespace heroes::authority {

/*
  The ledger program's keyless authority.

  Derived once at startup from the program id and a domain seed, then passed
  explicitly to whatever needs to sign on the program's behalf. The authority
  becomes the token delegate for listed assets, the mint authority for
  reissued assets and the update authority for their metadata.
*/
class ProgramAuthority {
 public:
  static ProgramAuthority Derive(const model::Pubkey& program_id, const std::string& seed);

  const model::Pubkey& address() const {
    return address_;
  }
  uint8_t bump() const {
    return bump_;
  }
  const model::Pubkey& program_id() const {
    return program_id_;
  }
  const std::string& seed() const {
    return seed_;
  }

  // {seed, [bump]}: the proof presented to external services.
  external::SignerSeeds Seeds() const;

 private:
  ProgramAuthority(model::Pubkey program_id, std::string seed, model::Pubkey address, uint8_t bump)
    : program_id_(program_id), seed_(std::move(seed)), address_(address), bump_(bump) {
  }

  model::Pubkey program_id_;
  std::string   seed_;
  model::Pubkey address_;
  uint8_t       bump_ = 0;
};

} // namespace heroes::authority
