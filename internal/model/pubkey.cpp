#include "pubkey.hpp"

#include <cstring>
#include <random>

#include "internal/util/base58.hpp"
#include "internal/util/errors.hpp"

namespace heroes::model {

Pubkey Pubkey::FromBytes(const uint8_t* data) {
  std::array<uint8_t, kSize> bytes{};
  std::memcpy(bytes.data(), data, kSize);
  return Pubkey(bytes);
}

Pubkey Pubkey::FromString(std::string_view base58) {
  auto decoded = util::DecodeBase58(base58);
  if (!decoded || decoded->size() != kSize) {
    throw util::DataIntegrityError(util::ErrorCode::InvalidInstructionData, "invalid base58 key '" + std::string(base58) + "'");
  }
  return FromBytes(decoded->data());
}

Pubkey Pubkey::Generate() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::array<uint8_t, kSize> bytes{};
  for (auto& b : bytes) b = static_cast<uint8_t>(rng());
  return Pubkey(bytes);
}

std::string Pubkey::ToString() const {
  return util::EncodeBase58(bytes_.data(), bytes_.data() + kSize);
}

bool Pubkey::IsZero() const {
  for (auto b : bytes_) {
    if (b != 0) return false;
  }
  return true;
}

std::size_t PubkeyHash::operator()(const Pubkey& key) const {
  std::size_t h;
  std::memcpy(&h, key.data(), sizeof(h));
  return h;
}

} // namespace heroes::model
