#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace heroes::util {

/*
  Base58 (Bitcoin alphabet) as used for ledger keys.

  Leading zero bytes map to leading '1' characters.
*/

std::string EncodeBase58(const uint8_t* begin, const uint8_t* end);

// nullopt on any character outside the alphabet.
std::optional<std::vector<uint8_t>> DecodeBase58(std::string_view text);

} // namespace heroes::util
