#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "payledger/common/amount.hpp"
#include "payledger/common/types.hpp"

namespace payledger {
namespace ledger {

enum class TransactionKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
  kDispute,
  kResolve,
  kChargeback,
};

// Exact, case-sensitive match against the five wire names.
[[nodiscard]] std::optional<TransactionKind> kind_from_string(std::string_view name) noexcept;
[[nodiscard]] std::string_view to_string(TransactionKind kind) noexcept;

// Deposits and withdrawals move money and are kept in the ledger history.
// The other kinds refer back to one of them by tx.
[[nodiscard]] constexpr bool is_monetary(TransactionKind kind) noexcept {
  return kind == TransactionKind::kDeposit || kind == TransactionKind::kWithdrawal;
}

struct TransactionRecord {
  TransactionKind kind{TransactionKind::kDeposit};
  common::ClientId client{0};
  common::TransactionId tx{0};
  common::Amount amount{};
  bool disputed{false};  // only ever set by the processor
};

}  // namespace ledger
}  // namespace payledger
