#include "payledger/ledger/transaction.hpp"

#include <array>
#include <utility>

namespace payledger {
namespace ledger {

namespace {

constexpr std::array<std::pair<std::string_view, TransactionKind>, 5> kKindNames{{
    {"deposit", TransactionKind::kDeposit},
    {"withdrawal", TransactionKind::kWithdrawal},
    {"dispute", TransactionKind::kDispute},
    {"resolve", TransactionKind::kResolve},
    {"chargeback", TransactionKind::kChargeback},
}};

}  // namespace

std::optional<TransactionKind> kind_from_string(std::string_view name) noexcept {
  for (const auto& [text, kind] : kKindNames) {
    if (text == name) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string_view to_string(TransactionKind kind) noexcept {
  switch (kind) {
    case TransactionKind::kDeposit:
      return "deposit";
    case TransactionKind::kWithdrawal:
      return "withdrawal";
    case TransactionKind::kDispute:
      return "dispute";
    case TransactionKind::kResolve:
      return "resolve";
    case TransactionKind::kChargeback:
      return "chargeback";
  }
  return "unknown";
}

}  // namespace ledger
}  // namespace payledger
