#include "instruction.hpp"

#include <string>

#include "internal/codec/borsh.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/overloaded.hpp"

namespace heroes::instruction {

HeroInstruction UnpackInstruction(const uint8_t* data, std::size_t size) {
  if (size == 0) {
    throw util::DataIntegrityError(util::ErrorCode::InvalidInstruction, "empty instruction data");
  }

  codec::BorshReader reader(data + 1, size - 1);
  HeroInstruction    instruction;

  switch (static_cast<Tag>(data[0])) {
    case Tag::kAddRecord: {
      AddRecordArgs args;
      args.hero_id      = reader.ReadU8();
      args.content_uri  = reader.ReadString();
      args.key_nft      = reader.ReadString();
      args.last_price   = reader.ReadU64();
      args.listed_price = reader.ReadU64();
      instruction       = std::move(args);
      break;
    }
    case Tag::kUpdateRecord: {
      UpdateRecordArgs args;
      args.hero_id     = reader.ReadU8();
      args.key_nft     = reader.ReadPubkey();
      args.new_price   = reader.ReadU64();
      args.content_uri = reader.ReadString();
      instruction      = std::move(args);
      break;
    }
    case Tag::kBuyRecord: {
      BuyRecordArgs args;
      args.hero_id = reader.ReadU8();
      instruction  = args;
      break;
    }
    default:
      throw util::DataIntegrityError(util::ErrorCode::InvalidInstruction, "unknown instruction tag " + std::to_string(data[0]));
  }

  reader.ExpectEnd();
  return instruction;
}

std::vector<uint8_t> PackInstruction(const HeroInstruction& instruction) {
  codec::BorshWriter writer;
  std::visit(util::Overloaded{
                 [&](const AddRecordArgs& args) {
                   writer.WriteU8(static_cast<uint8_t>(Tag::kAddRecord));
                   writer.WriteU8(args.hero_id);
                   writer.WriteString(args.content_uri);
                   writer.WriteString(args.key_nft);
                   writer.WriteU64(args.last_price);
                   writer.WriteU64(args.listed_price);
                 },
                 [&](const UpdateRecordArgs& args) {
                   writer.WriteU8(static_cast<uint8_t>(Tag::kUpdateRecord));
                   writer.WriteU8(args.hero_id);
                   writer.WritePubkey(args.key_nft);
                   writer.WriteU64(args.new_price);
                   writer.WriteString(args.content_uri);
                 },
                 [&](const BuyRecordArgs& args) {
                   writer.WriteU8(static_cast<uint8_t>(Tag::kBuyRecord));
                   writer.WriteU8(args.hero_id);
                 },
             },
             instruction);
  return writer.Release();
}

std::string_view InstructionName(const HeroInstruction& instruction) {
  return std::visit(util::Overloaded{
                        [](const AddRecordArgs&) -> std::string_view { return "add_record"; },
                        [](const UpdateRecordArgs&) -> std::string_view { return "update_record"; },
                        [](const BuyRecordArgs&) -> std::string_view { return "buy_record"; },
                    },
                    instruction);
}

} // namespace heroes::instruction
