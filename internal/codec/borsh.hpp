#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/pubkey.hpp"

namespace heroes::codec {

/*
  Borsh-compatible little-endian codec.

  Integers are fixed-width little-endian, strings are a u32 length followed
  by the raw bytes, keys are 32 raw bytes. Reads past the end throw
  util::DataIntegrityError(InvalidInstructionData).
*/

class BorshReader {
 public:
  BorshReader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {
  }

  uint8_t       ReadU8();
  uint32_t      ReadU32();
  uint64_t      ReadU64();
  std::string   ReadString();
  model::Pubkey ReadPubkey();

  std::size_t Remaining() const {
    return size_ - offset_;
  }

  // Every byte must have been consumed.
  void ExpectEnd() const;

 private:
  const uint8_t* Take(std::size_t n);

  const uint8_t* data_;
  std::size_t    size_;
  std::size_t    offset_ = 0;
};

class BorshWriter {
 public:
  void WriteU8(uint8_t value);
  void WriteU32(uint32_t value);
  void WriteU64(uint64_t value);
  void WriteString(const std::string& value);
  void WritePubkey(const model::Pubkey& key);

  const std::vector<uint8_t>& bytes() const {
    return out_;
  }
  std::vector<uint8_t> Release() {
    return std::move(out_);
  }

 private:
  std::vector<uint8_t> out_;
};

// Raw fixed-offset helpers used by the fixed-width account layouts.
uint32_t LoadU32(const uint8_t* p);
uint64_t LoadU64(const uint8_t* p);
void     StoreU32(uint8_t* p, uint32_t value);
void     StoreU64(uint8_t* p, uint64_t value);

} // namespace heroes::codec
