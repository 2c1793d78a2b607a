#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/authority/program_address.hpp"
#include "internal/authority/program_authority.hpp"
#include "internal/external/metadata_service.hpp"
#include "internal/external/token_service.hpp"
#include "internal/transfer/delegated_transfer.hpp"
#include "internal/util/errors.hpp"

namespace {

using heroes::account::AccountInfo;
using heroes::account::AccountState;
using heroes::authority::ProgramAuthority;
using heroes::external::SignerSeeds;
using heroes::model::Pubkey;
using heroes::transfer::DelegatedTransferCoordinator;

struct Call {
  std::string name;
  Pubkey      first;
  Pubkey      second;
  Pubkey      authority;
  bool        with_seeds = false;
  uint64_t    amount     = 0;
};

class RecordingTokenService final : public heroes::external::TokenService {
 public:
  void Approve(AccountInfo& source, const Pubkey& delegate, AccountInfo& owner, uint64_t amount) override {
    calls.push_back(Call{"approve", source.key, delegate, owner.key, false, amount});
  }

  void Transfer(AccountInfo& source, AccountInfo& destination, AccountInfo& authority, const SignerSeeds* seeds, uint64_t amount) override {
    if (fail_transfer) throw heroes::util::ExternalCallFailure(heroes::util::ErrorCode::InsufficientFunds, "no balance");
    calls.push_back(Call{"transfer", source.key, destination.key, authority.key, seeds != nullptr, amount});
    last_seeds = seeds ? *seeds : SignerSeeds{};
  }

  void MintTo(AccountInfo& mint, AccountInfo& destination, AccountInfo& authority, const SignerSeeds* seeds, uint64_t amount) override {
    calls.push_back(Call{"mint_to", mint.key, destination.key, authority.key, seeds != nullptr, amount});
  }

  std::vector<Call> calls;
  SignerSeeds       last_seeds;
  bool              fail_transfer = false;
};

class RecordingMetadataService final : public heroes::external::MetadataService {
 public:
  void Update(AccountInfo& metadata, const Pubkey& mint, AccountInfo& authority, const SignerSeeds* seeds, const std::string& name,
              const std::string& uri) override {
    calls.push_back(Call{"metadata_update:" + name + ":" + uri, metadata.key, mint, authority.key, seeds != nullptr, 0});
  }

  std::vector<Call> calls;
};

struct Fixture {
  ProgramAuthority authority = ProgramAuthority::Derive(Pubkey::Generate(), "hallofheros");
  AccountState     state;
  AccountInfo      holder{Pubkey::Generate(), true, true, &state};
  AccountInfo      token_account{Pubkey::Generate(), false, true, &state};
  AccountInfo      other_token_account{Pubkey::Generate(), false, true, &state};
  AccountInfo      authority_account{authority.address(), false, false, &state};
};

void TestGrantDelegateApprovesOneUnitToAuthority() {
  Fixture                      f;
  RecordingTokenService        token;
  DelegatedTransferCoordinator coordinator(f.authority, token);

  coordinator.GrantDelegate(f.token_account, f.holder, f.authority_account);

  assert(token.calls.size() == 1);
  assert(token.calls[0].name == "approve");
  assert(token.calls[0].first == f.token_account.key);
  assert(token.calls[0].second == f.authority.address());
  assert(token.calls[0].authority == f.holder.key);
  assert(token.calls[0].amount == 1);
}

void TestTransferSignsWithAuthoritySeeds() {
  Fixture                      f;
  RecordingTokenService        token;
  DelegatedTransferCoordinator coordinator(f.authority, token);

  coordinator.TransferAsset(f.token_account, f.other_token_account, f.authority_account);

  assert(token.calls.size() == 1);
  assert(token.calls[0].name == "transfer");
  assert(token.calls[0].with_seeds);
  assert(token.calls[0].amount == 1);

  // the presented seeds prove the authority address
  const auto derived = heroes::authority::CreateProgramAddress(token.last_seeds, f.authority.program_id());
  assert(derived && *derived == f.authority.address());
}

void TestWrongAuthorityAccountIsRejectedBeforeAnyCall() {
  Fixture                      f;
  RecordingTokenService        token;
  DelegatedTransferCoordinator coordinator(f.authority, token);

  AccountInfo impostor{Pubkey::Generate(), true, false, &f.state};

  bool threw = false;
  try {
    coordinator.TransferAsset(f.token_account, f.other_token_account, impostor);
  } catch (const heroes::util::AuthorizationError& e) {
    threw = e.code() == heroes::util::ErrorCode::InvalidSeeds;
  }
  assert(threw && "only the derived authority may sign");
  assert(token.calls.empty());
}

void TestExternalFailurePropagatesUnchanged() {
  Fixture                      f;
  RecordingTokenService        token;
  token.fail_transfer = true;
  DelegatedTransferCoordinator coordinator(f.authority, token);

  bool threw = false;
  try {
    coordinator.TransferAsset(f.token_account, f.other_token_account, f.authority_account);
  } catch (const heroes::util::ExternalCallFailure& e) {
    threw = e.code() == heroes::util::ErrorCode::InsufficientFunds;
  }
  assert(threw);
}

void TestIssueAndRetire() {
  Fixture                      f;
  RecordingTokenService        token;
  RecordingMetadataService     metadata;
  DelegatedTransferCoordinator coordinator(f.authority, token, &metadata);

  AccountInfo mint{Pubkey::Generate(), false, true, &f.state};
  AccountInfo metadata_account{Pubkey::Generate(), false, true, &f.state};
  const auto  old_mint = Pubkey::Generate();

  coordinator.RetireAsset(metadata_account, old_mint, f.authority_account, "RETIRED", "retired://");
  coordinator.IssueAsset(mint, f.token_account, f.authority_account);

  assert(metadata.calls.size() == 1);
  assert(metadata.calls[0].name == "metadata_update:RETIRED:retired://");
  assert(metadata.calls[0].second == old_mint);
  assert(metadata.calls[0].with_seeds);

  assert(token.calls.size() == 1);
  assert(token.calls[0].name == "mint_to");
  assert(token.calls[0].first == mint.key);
  assert(token.calls[0].with_seeds);
}

void TestRetireWithoutMetadataServiceFails() {
  Fixture                      f;
  RecordingTokenService        token;
  DelegatedTransferCoordinator coordinator(f.authority, token);

  AccountInfo metadata_account{Pubkey::Generate(), false, true, &f.state};
  bool        threw = false;
  try {
    coordinator.RetireAsset(metadata_account, Pubkey::Generate(), f.authority_account, "RETIRED", "retired://");
  } catch (const heroes::util::ExternalCallFailure&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestGrantDelegateApprovesOneUnitToAuthority();
  TestTransferSignsWithAuthoritySeeds();
  TestWrongAuthorityAccountIsRejectedBeforeAnyCall();
  TestExternalFailurePropagatesUnchanged();
  TestIssueAndRetire();
  TestRetireWithoutMetadataServiceFails();

  std::cout << "hero_registry_unit_delegated_transfer: pass\n";
  return 0;
}
