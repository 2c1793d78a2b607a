#include "metadata_layout.hpp"

#include <cstring>

#include "internal/codec/borsh.hpp"
#include "internal/util/errors.hpp"

namespace heroes::external {

namespace {

constexpr std::size_t kNameOffset = 64;
constexpr std::size_t kUriOffset  = kNameOffset + 4 + kMetadataNameCapacity;

std::string ReadText(const uint8_t* p, std::size_t capacity) {
  const uint32_t length = codec::LoadU32(p);
  if (length > capacity) {
    throw util::DataIntegrityError(util::ErrorCode::InvalidAccountData, "metadata text length " + std::to_string(length) + " exceeds capacity");
  }
  return std::string(reinterpret_cast<const char*>(p + 4), length);
}

void WriteText(uint8_t* p, const std::string& text, std::size_t capacity) {
  if (text.size() > capacity) {
    throw util::DataIntegrityError(util::ErrorCode::InvalidInstructionData, "metadata text '" + text + "' exceeds " + std::to_string(capacity) + " bytes");
  }
  std::memset(p, 0, 4 + capacity);
  codec::StoreU32(p, static_cast<uint32_t>(text.size()));
  std::memcpy(p + 4, text.data(), text.size());
}

} // namespace

AssetMetadata UnpackMetadata(const uint8_t* data, std::size_t size) {
  if (size != kMetadataSize) {
    throw util::DataIntegrityError(util::ErrorCode::InvalidAccountData, "metadata account is " + std::to_string(size) + " bytes");
  }

  AssetMetadata metadata;
  metadata.mint             = model::Pubkey::FromBytes(data);
  metadata.update_authority = model::Pubkey::FromBytes(data + 32);
  metadata.name             = ReadText(data + kNameOffset, kMetadataNameCapacity);
  metadata.uri              = ReadText(data + kUriOffset, kMetadataUriCapacity);
  return metadata;
}

void PackMetadata(const AssetMetadata& metadata, uint8_t* out) {
  std::memcpy(out, metadata.mint.data(), model::Pubkey::kSize);
  std::memcpy(out + 32, metadata.update_authority.data(), model::Pubkey::kSize);
  WriteText(out + kNameOffset, metadata.name, kMetadataNameCapacity);
  WriteText(out + kUriOffset, metadata.uri, kMetadataUriCapacity);
}

} // namespace heroes::external
