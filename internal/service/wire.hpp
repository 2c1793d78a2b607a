#pragma once

#include <google/protobuf/repeated_ptr_field.h>

#include <cstdint>
#include <string>
#include <vector>

#include "heroes/registry/v1/types.pb.h"
#include "internal/host/effect.hpp"
#include "internal/model/pubkey.hpp"

namespace heroes::service {

void AppendEffects(const host::EffectLog& effects, google::protobuf::RepeatedPtrField<heroes::registry::v1::Effect>* out);

// Throws util::AuthorizationError(MissingRequiredSignature) unless `bytes` is
// a valid ed25519 signature by `signer` over `message`, and
// util::DataIntegrityError(InvalidInstructionData) when it is not 64 bytes.
void VerifySignerSignature(const model::Pubkey& signer, const std::vector<uint8_t>& message, const std::string& bytes);

} // namespace heroes::service
