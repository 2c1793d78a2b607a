#include "record_repository.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace heroes::repository {

using util::DataIntegrityError;
using util::ErrorCode;

RecordRepository::RecordRepository(std::shared_ptr<arrow::Buffer> arena, std::size_t max_slots) : arena_(std::move(arena)), max_slots_(max_slots) {
}

void RecordRepository::CheckSlot(uint8_t slot_id) const {
  if (slot_id >= max_slots_) {
    throw DataIntegrityError(ErrorCode::SlotOutOfRange, "slot " + std::to_string(slot_id) + " >= max slots " + std::to_string(max_slots_));
  }

  const std::size_t end  = Offset(slot_id) + model::kHeroRecordSize;
  const std::size_t size = arena_ ? static_cast<std::size_t>(arena_->size()) : 0;
  if (size < end) {
    throw DataIntegrityError(ErrorCode::AccountDataTooSmall,
                             "repository holds " + std::to_string(size) + " bytes, slot " + std::to_string(slot_id) + " ends at " + std::to_string(end));
  }
}

model::HeroRecord RecordRepository::Read(uint8_t slot_id, const model::Pubkey& expected_key) const {
  CheckSlot(slot_id);

  auto record = model::DecodeHeroRecord(arena_->data() + Offset(slot_id));
  if (record.key_nft != expected_key) {
    HEROES_LOG_WARN("NFT key mismatch", {observability::IntField("slot", slot_id), observability::KeyField("stored", record.key_nft),
                                         observability::KeyField("presented", expected_key)});
    throw DataIntegrityError(ErrorCode::InvalidNFTKey, "slot " + std::to_string(slot_id) + " does not track asset " + expected_key.ToString());
  }
  if (record.hero_id != slot_id) {
    throw DataIntegrityError(ErrorCode::InvalidAccountData, "slot " + std::to_string(slot_id) + " holds hero id " + std::to_string(record.hero_id));
  }
  return record;
}

void RecordRepository::Write(const model::HeroRecord& record) {
  CheckSlot(record.hero_id);
  if (!arena_->is_mutable()) {
    throw DataIntegrityError(ErrorCode::InvalidAccountData, "repository buffer is read-only");
  }

  if (!model::EncodeHeroRecord(record, arena_->mutable_data() + Offset(record.hero_id))) {
    HEROES_LOG_WARN("content_uri truncated", {observability::IntField("slot", record.hero_id),
                                              observability::IntField("length", static_cast<std::int64_t>(record.content_uri.size()))});
  }
}

} // namespace heroes::repository
