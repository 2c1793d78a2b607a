#include "program_address.hpp"

#include <openssl/bn.h>
#include <openssl/sha.h>

#include <array>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace heroes::authority {

namespace {

constexpr char kPdaMarker[] = "ProgramDerivedAddress";

using BnPtr  = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using CtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;

BnPtr NewBn() {
  BnPtr bn(BN_new(), &BN_free);
  if (!bn) throw std::runtime_error("BN_new failed");
  return bn;
}

void Check(int ok, const char* what) {
  if (ok != 1) throw std::runtime_error(std::string("openssl bignum failure: ") + what);
}

/*
  Field constants for edwards25519:
    p = 2^255 - 19
    d = -121665 / 121666 mod p
*/
struct CurveConstants {
  BnPtr p    = NewBn();
  BnPtr d    = NewBn();
  BnPtr half = NewBn(); // (p - 1) / 2, the Euler criterion exponent

  CurveConstants() {
    CtxPtr ctx(BN_CTX_new(), &BN_CTX_free);
    if (!ctx) throw std::runtime_error("BN_CTX_new failed");

    BN_zero(p.get());
    Check(BN_set_bit(p.get(), 255), "set_bit");
    Check(BN_sub_word(p.get(), 19), "sub_word");

    auto denominator = NewBn();
    Check(BN_set_word(denominator.get(), 121666), "set_word");
    BnPtr inverse(BN_mod_inverse(nullptr, denominator.get(), p.get(), ctx.get()), &BN_free);
    if (!inverse) throw std::runtime_error("openssl bignum failure: mod_inverse");

    auto numerator = NewBn();
    Check(BN_set_word(numerator.get(), 121665), "set_word");
    Check(BN_sub(numerator.get(), p.get(), numerator.get()), "sub");
    Check(BN_mod_mul(d.get(), numerator.get(), inverse.get(), p.get(), ctx.get()), "mod_mul");

    Check(BN_copy(half.get(), p.get()) != nullptr, "copy");
    Check(BN_sub_word(half.get(), 1), "sub_word");
    Check(BN_rshift1(half.get(), half.get()), "rshift1");
  }
};

const CurveConstants& Curve() {
  static const CurveConstants constants;
  return constants;
}

void CheckSeeds(const external::SignerSeeds& seeds) {
  if (seeds.size() > kMaxSeeds) {
    throw util::AuthorizationError(util::ErrorCode::InvalidSeeds, std::to_string(seeds.size()) + " seeds exceed the limit of " + std::to_string(kMaxSeeds));
  }
  for (const auto& seed : seeds) {
    if (seed.size() > kMaxSeedLength) {
      throw util::AuthorizationError(util::ErrorCode::InvalidSeeds, "seed of " + std::to_string(seed.size()) + " bytes exceeds " + std::to_string(kMaxSeedLength));
    }
  }
}

} // namespace

bool IsOnCurve(const model::Pubkey& key) {
  const auto& curve = Curve();
  CtxPtr      ctx(BN_CTX_new(), &BN_CTX_free);
  if (!ctx) throw std::runtime_error("BN_CTX_new failed");

  // Compressed form: little-endian y with the x sign in the top bit.
  std::array<uint8_t, model::Pubkey::kSize> y_bytes = key.bytes();
  y_bytes[31] &= 0x7F;

  BnPtr y(BN_lebin2bn(y_bytes.data(), static_cast<int>(y_bytes.size()), nullptr), &BN_free);
  if (!y) throw std::runtime_error("openssl bignum failure: lebin2bn");
  Check(BN_nnmod(y.get(), y.get(), curve.p.get(), ctx.get()), "nnmod");

  // x^2 = (y^2 - 1) / (d y^2 + 1)
  auto y2 = NewBn();
  Check(BN_mod_sqr(y2.get(), y.get(), curve.p.get(), ctx.get()), "mod_sqr");

  auto u = NewBn();
  Check(BN_mod_sub(u.get(), y2.get(), BN_value_one(), curve.p.get(), ctx.get()), "mod_sub");

  auto v = NewBn();
  Check(BN_mod_mul(v.get(), curve.d.get(), y2.get(), curve.p.get(), ctx.get()), "mod_mul");
  Check(BN_mod_add(v.get(), v.get(), BN_value_one(), curve.p.get(), ctx.get()), "mod_add");

  if (BN_is_zero(u.get())) return true;
  if (BN_is_zero(v.get())) return false;

  BnPtr v_inverse(BN_mod_inverse(nullptr, v.get(), curve.p.get(), ctx.get()), &BN_free);
  if (!v_inverse) throw std::runtime_error("openssl bignum failure: mod_inverse");

  auto x2 = NewBn();
  Check(BN_mod_mul(x2.get(), u.get(), v_inverse.get(), curve.p.get(), ctx.get()), "mod_mul");

  // Euler's criterion: x2 is a square iff x2^((p-1)/2) == 1.
  auto legendre = NewBn();
  Check(BN_mod_exp(legendre.get(), x2.get(), curve.half.get(), curve.p.get(), ctx.get()), "mod_exp");
  return BN_is_one(legendre.get());
}

std::optional<model::Pubkey> CreateProgramAddress(const external::SignerSeeds& seeds, const model::Pubkey& program_id) {
  CheckSeeds(seeds);

  std::vector<uint8_t> preimage;
  for (const auto& seed : seeds) preimage.insert(preimage.end(), seed.begin(), seed.end());
  preimage.insert(preimage.end(), program_id.data(), program_id.data() + model::Pubkey::kSize);
  preimage.insert(preimage.end(), kPdaMarker, kPdaMarker + std::strlen(kPdaMarker));

  std::array<uint8_t, SHA256_DIGEST_LENGTH> digest{};
  SHA256(preimage.data(), preimage.size(), digest.data());

  model::Pubkey candidate(digest);
  if (IsOnCurve(candidate)) return std::nullopt;
  return candidate;
}

std::pair<model::Pubkey, uint8_t> FindProgramAddress(const external::SignerSeeds& seeds, const model::Pubkey& program_id) {
  external::SignerSeeds with_bump = seeds;
  with_bump.push_back({0});

  for (int bump = 255; bump > 0; --bump) {
    with_bump.back()[0] = static_cast<uint8_t>(bump);
    if (auto address = CreateProgramAddress(with_bump, program_id)) {
      return {*address, static_cast<uint8_t>(bump)};
    }
  }
  throw util::AuthorizationError(util::ErrorCode::InvalidSeeds, "no viable bump seed for program " + program_id.ToString());
}

} // namespace heroes::authority
