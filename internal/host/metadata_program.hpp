#pragma once

#include "internal/external/metadata_service.hpp"
#include "internal/host/invocation.hpp"

namespace heroes::host {

// In-memory metadata program. Only the stored update authority may rewrite a record.
class MetadataProgram final : public external::MetadataService {
 public:
  MetadataProgram(model::Pubkey program_id, Invocation invocation) : program_id_(program_id), invocation_(invocation) {
  }

  void Update(account::AccountInfo& metadata, const model::Pubkey& mint, account::AccountInfo& update_authority, const external::SignerSeeds* authority_seeds,
              const std::string& new_name, const std::string& new_uri) override;

 private:
  model::Pubkey program_id_;
  Invocation    invocation_;
};

} // namespace heroes::host
