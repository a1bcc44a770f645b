#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include "payledger/ledger/ledger_state.hpp"
#include "payledger/ledger/transaction.hpp"

namespace payledger {
namespace processor {

// What apply() did with a record. Every value other than kApplied is a silent
// no-op on the ledger; none of them is an error.
enum class Outcome : std::uint8_t {
  kApplied,
  kIgnoredLocked,
  kInsufficientFunds,
  kUnknownTransaction,
  kAlreadyDisputed,
  kNotDisputed,
};

[[nodiscard]] std::string_view to_string(Outcome outcome) noexcept;

class TransactionProcessor {
 public:
  explicit TransactionProcessor(std::shared_ptr<ledger::LedgerState> ledger);

  Outcome apply(const ledger::TransactionRecord& record);

 private:
  Outcome apply_monetary(const ledger::TransactionRecord& record);
  Outcome apply_dispute(const ledger::TransactionRecord& record);
  Outcome apply_resolve(const ledger::TransactionRecord& record);
  Outcome apply_chargeback(const ledger::TransactionRecord& record);

  std::shared_ptr<ledger::LedgerState> ledger_;
};

}  // namespace processor
}  // namespace payledger
