#include "hero_record.hpp"

#include <cstring>
#include <string>

#include "internal/codec/borsh.hpp"
#include "internal/util/errors.hpp"

namespace heroes::model {

namespace {

constexpr std::size_t kHeroIdOffset      = 0;
constexpr std::size_t kUriLengthOffset   = 1;
constexpr std::size_t kUriOffset         = 5;
constexpr std::size_t kKeyOffset         = kUriOffset + kContentUriCapacity;
constexpr std::size_t kLastPriceOffset   = kKeyOffset + Pubkey::kSize;
constexpr std::size_t kListedPriceOffset = kLastPriceOffset + 8;

static_assert(kListedPriceOffset + 8 == kHeroRecordSize);

// Longest prefix of `uri` within the capacity that does not split a UTF-8 sequence.
std::size_t StoredUriLength(const std::string& uri) {
  if (uri.size() <= kContentUriCapacity) return uri.size();

  std::size_t length = kContentUriCapacity;
  while (length > 0 && (static_cast<uint8_t>(uri[length]) & 0xC0) == 0x80) {
    --length;
  }
  return length;
}

} // namespace

bool EncodeHeroRecord(const HeroRecord& record, uint8_t* out) {
  const std::size_t uri_length = StoredUriLength(record.content_uri);

  std::memset(out, 0, kHeroRecordSize);
  out[kHeroIdOffset] = record.hero_id;
  codec::StoreU32(out + kUriLengthOffset, static_cast<uint32_t>(uri_length));
  std::memcpy(out + kUriOffset, record.content_uri.data(), uri_length);
  std::memcpy(out + kKeyOffset, record.key_nft.data(), Pubkey::kSize);
  codec::StoreU64(out + kLastPriceOffset, record.last_price);
  codec::StoreU64(out + kListedPriceOffset, record.listed_price);

  return uri_length == record.content_uri.size();
}

HeroRecord DecodeHeroRecord(const uint8_t* in) {
  const uint32_t uri_length = codec::LoadU32(in + kUriLengthOffset);
  if (uri_length > kContentUriCapacity) {
    throw util::DataIntegrityError(util::ErrorCode::InvalidAccountData, "stored content_uri length " + std::to_string(uri_length) + " exceeds capacity");
  }

  HeroRecord record;
  record.hero_id = in[kHeroIdOffset];
  record.content_uri.assign(reinterpret_cast<const char*>(in + kUriOffset), uri_length);
  record.key_nft      = Pubkey::FromBytes(in + kKeyOffset);
  record.last_price   = codec::LoadU64(in + kLastPriceOffset);
  record.listed_price = codec::LoadU64(in + kListedPriceOffset);
  return record;
}

} // namespace heroes::model
