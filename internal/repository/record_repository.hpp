#pragma once

#include <arrow/buffer.h>

#include <cstddef>
#include <cstdint>
#include <memory>

#include "internal/model/hero_record.hpp"
#include "internal/model/pubkey.hpp"

namespace heroes::repository {

/*
  Fixed-slot record store over the repository account's data buffer.

  Slot i occupies bytes [i * kHeroRecordSize, (i + 1) * kHeroRecordSize).
  Writes never touch bytes outside their slot.

  Failures are util::DataIntegrityError:
    SlotOutOfRange      slot_id >= max_slots
    AccountDataTooSmall buffer shorter than the slot's end offset
    InvalidAccountData  buffer not mutable (write) or corrupt slot (read)
    InvalidNFTKey       stored key_nft differs from the presented asset
*/
class RecordRepository {
 public:
  RecordRepository(std::shared_ptr<arrow::Buffer> arena, std::size_t max_slots);

  model::HeroRecord Read(uint8_t slot_id, const model::Pubkey& expected_key) const;

  void Write(const model::HeroRecord& record);

  // Range and size checks only; lets callers fail before any side effect.
  void CheckSlot(uint8_t slot_id) const;

  std::size_t max_slots() const {
    return max_slots_;
  }

  static std::size_t Offset(uint8_t slot_id) {
    return static_cast<std::size_t>(slot_id) * model::kHeroRecordSize;
  }

  // Minimum arena size for a repository holding max_slots records.
  static std::size_t RequiredSize(std::size_t max_slots) {
    return max_slots * model::kHeroRecordSize;
  }

 private:
  std::shared_ptr<arrow::Buffer> arena_;
  std::size_t                    max_slots_;
};

} // namespace heroes::repository
