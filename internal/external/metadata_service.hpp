#pragma once

#include <string>

#include "internal/account/account_info.hpp"
#include "internal/external/signer_seeds.hpp"
#include "internal/model/pubkey.hpp"

namespace heroes::external {

/*
  Asset metadata service.

  Update rewrites name and uri of the metadata describing `mint`. Gated on
  the stored update authority, which signs directly or through seeds.
*/
class MetadataService {
 public:
  virtual ~MetadataService() = default;

  virtual void Update(account::AccountInfo& metadata, const model::Pubkey& mint, account::AccountInfo& update_authority,
                      const SignerSeeds* authority_seeds, const std::string& new_name, const std::string& new_uri) = 0;
};

} // namespace heroes::external
