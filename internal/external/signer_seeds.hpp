#pragma once

#include <cstdint>
#include <vector>

namespace heroes::external {

// Seeds proving a program-derived authority. The service re-derives the
// address from these seeds and the invoking program's id.
using SignerSeeds = std::vector<std::vector<uint8_t>>;

} // namespace heroes::external
