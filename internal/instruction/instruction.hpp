#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/model/pubkey.hpp"

namespace heroes::instruction {

/*
  Instruction wire format: one tag byte followed by the Borsh encoding of
  the arguments.

    0 AddRecord     u8 hero_id, string content_uri, string key_nft (base58),
                    u64 last_price, u64 listed_price
    1 UpdateRecord  u8 hero_id, [32] key_nft, u64 new_price, string content_uri
    2 BuyRecord     u8 hero_id
*/

enum class Tag : uint8_t {
  kAddRecord    = 0,
  kUpdateRecord = 1,
  kBuyRecord    = 2,
};

struct AddRecordArgs {
  uint8_t     hero_id = 0;
  std::string content_uri;
  std::string key_nft;
  uint64_t    last_price   = 0;
  uint64_t    listed_price = 0;
};

struct UpdateRecordArgs {
  uint8_t       hero_id = 0;
  model::Pubkey key_nft;
  uint64_t      new_price = 0;
  std::string   content_uri;
};

struct BuyRecordArgs {
  uint8_t hero_id = 0;
};

using HeroInstruction = std::variant<AddRecordArgs, UpdateRecordArgs, BuyRecordArgs>;

// Empty input or unknown tag -> util::DataIntegrityError(InvalidInstruction).
// Short or trailing argument bytes -> util::DataIntegrityError(InvalidInstructionData).
HeroInstruction UnpackInstruction(const uint8_t* data, std::size_t size);

std::vector<uint8_t> PackInstruction(const HeroInstruction& instruction);

std::string_view InstructionName(const HeroInstruction& instruction);

} // namespace heroes::instruction
