#include "borsh.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace heroes::codec {

uint32_t LoadU32(const uint8_t* p) {
  uint32_t value = 0;
  for (int i = 3; i >= 0; --i) value = (value << 8) | p[i];
  return value;
}

uint64_t LoadU64(const uint8_t* p) {
  uint64_t value = 0;
  for (int i = 7; i >= 0; --i) value = (value << 8) | p[i];
  return value;
}

void StoreU32(uint8_t* p, uint32_t value) {
  for (int i = 0; i < 4; ++i) p[i] = static_cast<uint8_t>(value >> (8 * i));
}

void StoreU64(uint8_t* p, uint64_t value) {
  for (int i = 0; i < 8; ++i) p[i] = static_cast<uint8_t>(value >> (8 * i));
}

const uint8_t* BorshReader::Take(std::size_t n) {
  if (n > Remaining()) {
    throw util::DataIntegrityError(util::ErrorCode::InvalidInstructionData,
                                   "unexpected end of input: need " + std::to_string(n) + " bytes, have " + std::to_string(Remaining()));
  }
  const uint8_t* p = data_ + offset_;
  offset_ += n;
  return p;
}

uint8_t BorshReader::ReadU8() {
  return *Take(1);
}

uint32_t BorshReader::ReadU32() {
  return LoadU32(Take(4));
}

uint64_t BorshReader::ReadU64() {
  return LoadU64(Take(8));
}

std::string BorshReader::ReadString() {
  const uint32_t length = ReadU32();
  const auto*    bytes  = Take(length);
  return std::string(reinterpret_cast<const char*>(bytes), length);
}

model::Pubkey BorshReader::ReadPubkey() {
  return model::Pubkey::FromBytes(Take(model::Pubkey::kSize));
}

void BorshReader::ExpectEnd() const {
  if (Remaining() != 0) {
    throw util::DataIntegrityError(util::ErrorCode::InvalidInstructionData, std::to_string(Remaining()) + " trailing bytes after arguments");
  }
}

void BorshWriter::WriteU8(uint8_t value) {
  out_.push_back(value);
}

void BorshWriter::WriteU32(uint32_t value) {
  uint8_t buf[4];
  StoreU32(buf, value);
  out_.insert(out_.end(), buf, buf + 4);
}

void BorshWriter::WriteU64(uint64_t value) {
  uint8_t buf[8];
  StoreU64(buf, value);
  out_.insert(out_.end(), buf, buf + 8);
}

void BorshWriter::WriteString(const std::string& value) {
  WriteU32(static_cast<uint32_t>(value.size()));
  out_.insert(out_.end(), value.begin(), value.end());
}

void BorshWriter::WritePubkey(const model::Pubkey& key) {
  out_.insert(out_.end(), key.data(), key.data() + model::Pubkey::kSize);
}

} // namespace heroes::codec
