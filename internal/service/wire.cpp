#include "wire.hpp"

#include <algorithm>

#include "internal/crypto/signature.hpp"
#include "internal/util/errors.hpp"

namespace heroes::service {

using namespace heroes::registry::v1;

namespace {

::heroes::registry::v1::EffectKind ToProto(host::EffectKind kind) {
  switch (kind) {
    case host::EffectKind::kApprove:
      return EFFECT_KIND_APPROVE;
    case host::EffectKind::kTokenTransfer:
      return EFFECT_KIND_TOKEN_TRANSFER;
    case host::EffectKind::kMintTo:
      return EFFECT_KIND_MINT_TO;
    case host::EffectKind::kPayment:
      return EFFECT_KIND_PAYMENT;
    case host::EffectKind::kMetadataUpdate:
      return EFFECT_KIND_METADATA_UPDATE;
  }
  return EFFECT_KIND_UNSPECIFIED;
}

} // namespace

void AppendEffects(const host::EffectLog& effects, google::protobuf::RepeatedPtrField<Effect>* out) {
  for (const auto& effect : effects) {
    auto* item = out->Add();
    item->set_kind(ToProto(effect.kind));
    item->set_source(effect.source.ToString());
    item->set_destination(effect.destination.ToString());
    item->set_authority(effect.authority.ToString());
    item->set_amount(effect.amount);
    item->set_detail(effect.detail);
  }
}

void VerifySignerSignature(const model::Pubkey& signer, const std::vector<uint8_t>& message, const std::string& bytes) {
  if (bytes.size() != crypto::kSignatureSize) {
    throw util::DataIntegrityError(util::ErrorCode::InvalidInstructionData, "signature for " + signer.ToString() + " is not 64 bytes");
  }
  crypto::Signature signature{};
  std::copy(bytes.begin(), bytes.end(), signature.begin());
  if (!crypto::Verify(signer, message, signature)) {
    throw util::AuthorizationError(util::ErrorCode::MissingRequiredSignature, "invalid signature for signer " + signer.ToString());
  }
}

} // namespace heroes::service
