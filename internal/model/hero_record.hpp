#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "internal/model/pubkey.hpp"

namespace heroes::model {

/*
  Persistent hero record, one per repository slot.

  IMPORTANT:
  - hero_id is the slot index and never changes once written.
  - key_nft names the asset (mint) the slot tracks. Every read is checked
    against the asset the instruction presents.
  - last_price only changes on a completed sale, listed_price only on update.
*/

struct HeroRecord {
  uint8_t     hero_id = 0;
  std::string content_uri;
  Pubkey      key_nft;
  uint64_t    last_price   = 0;
  uint64_t    listed_price = 0;

  bool operator==(const HeroRecord&) const = default;
};

// content_uri is stored in a fixed-capacity, zero padded field.
inline constexpr std::size_t kContentUriCapacity = 200;

// hero_id | uri length (u32) | uri bytes | key_nft | last_price | listed_price
inline constexpr std::size_t kHeroRecordSize = 1 + 4 + kContentUriCapacity + Pubkey::kSize + 8 + 8;

// Writes exactly kHeroRecordSize bytes. A content_uri longer than the
// capacity is truncated at the last whole UTF-8 sequence that fits;
// returns false when that happened.
bool EncodeHeroRecord(const HeroRecord& record, uint8_t* out);

// Reads exactly kHeroRecordSize bytes. Throws util::DataIntegrityError(InvalidAccountData)
// when the stored uri length exceeds the capacity.
HeroRecord DecodeHeroRecord(const uint8_t* in);

} // namespace heroes::model
