#pragma once

#include <arrow/buffer.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "internal/model/pubkey.hpp"

namespace heroes::account {

/*
  State of one ledger account.

  Account data is an Arrow buffer. The host hands the processor mutable
  buffers owned by the instruction's working snapshot, so in-place writes
  are discarded if the instruction fails.
*/
struct AccountState {
  model::Pubkey                  owner;
  uint64_t                       lamports = 0;
  std::shared_ptr<arrow::Buffer> data;
  bool                           executable = false;
};

// Zero-filled mutable data buffer of `size` bytes.
std::shared_ptr<arrow::Buffer> AllocateAccountData(std::size_t size);

// Mutable deep copy; a null source yields an empty buffer.
std::shared_ptr<arrow::Buffer> CopyAccountData(const std::shared_ptr<arrow::Buffer>& source);

/*
  One account as presented to an instruction: its key, the flags the caller
  asserted, and a borrowed view of its state.
*/
struct AccountInfo {
  model::Pubkey key;
  bool          is_signer   = false;
  bool          is_writable = false;
  AccountState* state       = nullptr;

  const model::Pubkey& owner() const {
    return state->owner;
  }

  const uint8_t* data() const {
    return state->data ? state->data->data() : nullptr;
  }

  std::size_t data_size() const {
    return state->data ? static_cast<std::size_t>(state->data->size()) : 0;
  }
};

/*
  Positional account iterator. Running past the end throws
  util::DataIntegrityError(NotEnoughAccountKeys).
*/
class AccountCursor {
 public:
  explicit AccountCursor(std::vector<AccountInfo>& accounts) : accounts_(accounts) {
  }

  AccountInfo& Next();

 private:
  std::vector<AccountInfo>& accounts_;
  std::size_t               next_ = 0;
};

} // namespace heroes::account
