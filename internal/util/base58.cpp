#include "base58.hpp"

#include <cstring>

namespace heroes::util {

namespace {

constexpr char kAlphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int DigitOf(char c) {
  const char* pos = std::strchr(kAlphabet, c);
  if (c == '\0' || pos == nullptr) return -1;
  return static_cast<int>(pos - kAlphabet);
}

} // namespace

std::string EncodeBase58(const uint8_t* begin, const uint8_t* end) {
  std::size_t zeroes = 0;
  while (begin != end && *begin == 0) {
    ++begin;
    ++zeroes;
  }

  // log(256) / log(58), rounded up.
  std::vector<uint8_t> b58(static_cast<std::size_t>(end - begin) * 138 / 100 + 1);
  std::size_t          length = 0;
  for (; begin != end; ++begin) {
    int         carry = *begin;
    std::size_t i     = 0;
    // b58 = b58 * 256 + byte
    for (auto it = b58.rbegin(); (carry != 0 || i < length) && it != b58.rend(); ++it, ++i) {
      carry += 256 * (*it);
      *it = static_cast<uint8_t>(carry % 58);
      carry /= 58;
    }
    length = i;
  }

  auto it = b58.begin() + static_cast<std::ptrdiff_t>(b58.size() - length);
  while (it != b58.end() && *it == 0) ++it;

  std::string out;
  out.reserve(zeroes + static_cast<std::size_t>(b58.end() - it));
  out.assign(zeroes, '1');
  for (; it != b58.end(); ++it) out.push_back(kAlphabet[*it]);
  return out;
}

std::optional<std::vector<uint8_t>> DecodeBase58(std::string_view text) {
  std::size_t pos    = 0;
  std::size_t zeroes = 0;
  while (pos < text.size() && text[pos] == '1') {
    ++zeroes;
    ++pos;
  }

  // log(58) / log(256), rounded up.
  std::vector<uint8_t> b256((text.size() - pos) * 733 / 1000 + 1);
  std::size_t          length = 0;
  for (; pos < text.size(); ++pos) {
    int carry = DigitOf(text[pos]);
    if (carry < 0) return std::nullopt;

    std::size_t i = 0;
    // b256 = b256 * 58 + digit
    for (auto it = b256.rbegin(); (carry != 0 || i < length) && it != b256.rend(); ++it, ++i) {
      carry += 58 * (*it);
      *it = static_cast<uint8_t>(carry % 256);
      carry /= 256;
    }
    length = i;
  }

  auto it = b256.begin() + static_cast<std::ptrdiff_t>(b256.size() - length);
  while (it != b256.end() && *it == 0) ++it;

  std::vector<uint8_t> out;
  out.reserve(zeroes + static_cast<std::size_t>(b256.end() - it));
  out.assign(zeroes, 0x00);
  out.insert(out.end(), it, b256.end());
  return out;
}

} // namespace heroes::util
