#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "internal/model/pubkey.hpp"

namespace heroes::external {

/*
  Asset metadata account owned by the metadata service.

    mint(32) update_authority(32) name(u32 + 32 bytes) uri(u32 + 200 bytes)

  Text fields are zero padded to their capacity.
*/

inline constexpr std::size_t kMetadataNameCapacity = 32;
inline constexpr std::size_t kMetadataUriCapacity  = 200;
inline constexpr std::size_t kMetadataSize         = 32 + 32 + 4 + kMetadataNameCapacity + 4 + kMetadataUriCapacity;

struct AssetMetadata {
  model::Pubkey mint;
  model::Pubkey update_authority;
  std::string   name;
  std::string   uri;
};

// Throws util::DataIntegrityError(InvalidAccountData) on a wrong size or oversized text.
AssetMetadata UnpackMetadata(const uint8_t* data, std::size_t size);

// Throws util::DataIntegrityError(InvalidInstructionData) when a text field exceeds its capacity.
void PackMetadata(const AssetMetadata& metadata, uint8_t* out);

} // namespace heroes::external
