#include "account_info.hpp"

#include <arrow/memory_pool.h>

#include <cstring>
#include <utility>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace heroes::account {

std::shared_ptr<arrow::Buffer> AllocateAccountData(std::size_t size) {
  auto result = arrow::AllocateBuffer(static_cast<int64_t>(size));
  if (!result.ok()) throw std::runtime_error(result.status().ToString());

  std::shared_ptr<arrow::Buffer> buffer(std::move(*result));
  if (size > 0) std::memset(buffer->mutable_data(), 0, size);
  return buffer;
}

std::shared_ptr<arrow::Buffer> CopyAccountData(const std::shared_ptr<arrow::Buffer>& source) {
  const std::size_t size   = source ? static_cast<std::size_t>(source->size()) : 0;
  auto              buffer = AllocateAccountData(size);
  if (size > 0) std::memcpy(buffer->mutable_data(), source->data(), size);
  return buffer;
}

AccountInfo& AccountCursor::Next() {
  if (next_ >= accounts_.size()) {
    throw util::DataIntegrityError(util::ErrorCode::NotEnoughAccountKeys, "expected at least " + std::to_string(next_ + 1) + " accounts");
  }
  return accounts_[next_++];
}

} // namespace heroes::account
