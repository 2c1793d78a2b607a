#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "internal/authority/program_address.hpp"
#include "internal/authority/program_authority.hpp"
#include "internal/util/errors.hpp"

namespace {

using heroes::authority::CreateProgramAddress;
using heroes::authority::FindProgramAddress;
using heroes::authority::IsOnCurve;
using heroes::authority::ProgramAuthority;
using heroes::external::SignerSeeds;
using heroes::model::Pubkey;

std::vector<uint8_t> Bytes(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

Pubkey FromHex(const std::string& hex) {
  std::array<uint8_t, Pubkey::kSize> bytes{};
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<uint8_t>(std::stoul(hex.substr(2 * i, 2), nullptr, 16));
  }
  return Pubkey(bytes);
}

void TestCurvePointsAreDetected() {
  // ed25519 base point
  assert(IsOnCurve(FromHex("5866666666666666666666666666666666666666666666666666666666666666")));
  // identity, y = 1
  assert(IsOnCurve(FromHex("0100000000000000000000000000000000000000000000000000000000000000")));
}

void TestKnownProgramAddresses() {
  const auto program_id = Pubkey::FromString("BPFLoaderUpgradeab1e11111111111111111111111");
  const auto seed_key   = Pubkey::FromString("SeedPubey1111111111111111111111111111111111");

  auto address = CreateProgramAddress(SignerSeeds{Bytes(""), {1}}, program_id);
  assert(address && address->ToString() == "BwqrghZA2htAcqq8dzP1WDAhTXYTYWj7CHxF5j7TDBAe");

  address = CreateProgramAddress(SignerSeeds{Bytes("\xe2\x98\x89"), {0}}, program_id);
  assert(address && address->ToString() == "13yWmRpaTR4r5nAktwLqMpRNr28tnVUZw26rTvPSSB19");

  address = CreateProgramAddress(SignerSeeds{Bytes("Talking"), Bytes("Squirrels")}, program_id);
  assert(address && address->ToString() == "2fnQrngrQT4SeLcdToJAD96phoEjNL2man2kfRLCASVk");

  address = CreateProgramAddress(SignerSeeds{std::vector<uint8_t>(seed_key.data(), seed_key.data() + Pubkey::kSize), {1}}, program_id);
  assert(address && address->ToString() == "976ymqVnfE32QFe6NfGDctSvVa36LWnvYxhU6G2232YL");
}

void TestOnCurveCandidateIsSkipped() {
  const auto program_id = Pubkey::FromString("HeroRegistry1111111111111111111111111111111");

  // bump 255 hashes onto the curve for this program, so 254 is chosen
  assert(!CreateProgramAddress(SignerSeeds{Bytes("hallofheros"), {255}}, program_id).has_value());

  const auto [address, bump] = FindProgramAddress(SignerSeeds{Bytes("hallofheros")}, program_id);
  assert(bump == 254);
  assert(address.ToString() == "9conJq6WwJ4FHQUdCLvaW6Aja3imPmHaLcoCztwZAMsN");
  assert(!IsOnCurve(address));
}

void TestAuthorityIsDeterministic() {
  const auto program_id = Pubkey::FromString("HeroRegistry1111111111111111111111111111111");
  const auto first      = ProgramAuthority::Derive(program_id, "hallofheros");
  const auto second     = ProgramAuthority::Derive(program_id, "hallofheros");

  assert(first.address() == second.address());
  assert(first.bump() == second.bump());
  assert(first.program_id() == program_id);

  const auto seeds = first.Seeds();
  assert(seeds.size() == 2);
  assert(seeds[0] == Bytes("hallofheros"));
  assert(seeds[1] == std::vector<uint8_t>{first.bump()});

  const auto recreated = CreateProgramAddress(seeds, program_id);
  assert(recreated && *recreated == first.address());

  // another program or seed never yields the same authority
  assert(ProgramAuthority::Derive(Pubkey::Generate(), "hallofheros").address() != first.address());
  assert(ProgramAuthority::Derive(program_id, "hallofvillains").address() != first.address());
}

void TestSeedLimitsAreEnforced() {
  const auto program_id = Pubkey::Generate();

  bool threw = false;
  try {
    (void)CreateProgramAddress(SignerSeeds{std::vector<uint8_t>(heroes::authority::kMaxSeedLength + 1, 'a')}, program_id);
  } catch (const heroes::util::AuthorizationError& e) {
    threw = e.code() == heroes::util::ErrorCode::InvalidSeeds;
  }
  assert(threw && "seeds longer than 32 bytes must be rejected");

  threw = false;
  try {
    (void)CreateProgramAddress(SignerSeeds(heroes::authority::kMaxSeeds + 1, std::vector<uint8_t>{1}), program_id);
  } catch (const heroes::util::AuthorizationError&) {
    threw = true;
  }
  assert(threw && "more than 16 seeds must be rejected");
}

} // namespace

int main() {
  TestCurvePointsAreDetected();
  TestKnownProgramAddresses();
  TestOnCurveCandidateIsSkipped();
  TestAuthorityIsDeterministic();
  TestSeedLimitsAreEnforced();

  std::cout << "hero_registry_unit_program_address: pass\n";
  return 0;
}
