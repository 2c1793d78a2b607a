#include "metadata_program.hpp"

#include "internal/external/metadata_layout.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace heroes::host {

using util::ErrorCode;
using util::ExternalCallFailure;

void MetadataProgram::Update(account::AccountInfo& metadata, const model::Pubkey& mint, account::AccountInfo& update_authority,
                             const external::SignerSeeds* authority_seeds, const std::string& new_name, const std::string& new_uri) {
  RequireOwnedBy(metadata, program_id_, "metadata");
  auto record = external::UnpackMetadata(metadata.data(), metadata.data_size());

  if (record.mint != mint) {
    throw ExternalCallFailure(ErrorCode::MintMismatch, "metadata " + metadata.key.ToString() + " does not describe mint " + mint.ToString());
  }
  if (record.update_authority != update_authority.key) {
    throw ExternalCallFailure(ErrorCode::OwnerMismatch, update_authority.key.ToString() + " is not the update authority of " + metadata.key.ToString());
  }
  VerifyAuthority(invocation_, update_authority, authority_seeds);

  record.name = new_name;
  record.uri  = new_uri;
  external::PackMetadata(record, WritableData(metadata, external::kMetadataSize));

  invocation_.Record(Effect{EffectKind::kMetadataUpdate, metadata.key, mint, update_authority.key, 0, new_name + " " + new_uri});
  HEROES_LOG_DEBUG("metadata update", {observability::KeyField("metadata", metadata.key), observability::StringField("name", new_name)});
}

} // namespace heroes::host
