#include "program_authority.hpp"

#include "internal/authority/program_address.hpp"
#include "internal/observability/logging.hpp"

namespace heroes::authority {

ProgramAuthority ProgramAuthority::Derive(const model::Pubkey& program_id, const std::string& seed) {
  const external::SignerSeeds seeds{std::vector<uint8_t>(seed.begin(), seed.end())};
  const auto [address, bump] = FindProgramAddress(seeds, program_id);

  HEROES_LOG_DEBUG("derived program authority",
                   {observability::KeyField("program_id", program_id), observability::KeyField("authority", address), observability::IntField("bump", bump)});
  return ProgramAuthority(program_id, seed, address, bump);
}

external::SignerSeeds ProgramAuthority::Seeds() const {
  return {std::vector<uint8_t>(seed_.begin(), seed_.end()), std::vector<uint8_t>{bump_}};
}

} // namespace heroes::authority
