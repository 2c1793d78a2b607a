#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace heroes::model {

/*
  32 byte ledger key.

  Identifies accounts, programs and assets (mints). Textual form is base58.
*/
class Pubkey {
 public:
  static constexpr std::size_t kSize = 32;

  Pubkey() = default;
  explicit Pubkey(const std::array<uint8_t, kSize>& bytes) : bytes_(bytes) {
  }

  static Pubkey FromBytes(const uint8_t* data);

  // Throws util::DataIntegrityError(InvalidInstructionData) on malformed text.
  static Pubkey FromString(std::string_view base58);

  // Random key, for fixtures and freshly created accounts.
  static Pubkey Generate();

  std::string ToString() const;

  const uint8_t* data() const {
    return bytes_.data();
  }
  const std::array<uint8_t, kSize>& bytes() const {
    return bytes_;
  }

  bool IsZero() const;

  bool operator==(const Pubkey& other) const {
    return bytes_ == other.bytes_;
  }
  bool operator!=(const Pubkey& other) const {
    return bytes_ != other.bytes_;
  }
  bool operator<(const Pubkey& other) const {
    return bytes_ < other.bytes_;
  }

 private:
  std::array<uint8_t, kSize> bytes_{};
};

struct PubkeyHash {
  std::size_t operator()(const Pubkey& key) const;
};

} // namespace heroes::model
