#include "payledger/processor/transaction_processor.hpp"

#include <stdexcept>
#include <utility>

#include "payledger/common/logging.hpp"

namespace payledger {
namespace processor {

using ledger::Account;
using ledger::TransactionKind;
using ledger::TransactionRecord;

std::string_view to_string(Outcome outcome) noexcept {
  switch (outcome) {
    case Outcome::kApplied:
      return "applied";
    case Outcome::kIgnoredLocked:
      return "ignored_locked";
    case Outcome::kInsufficientFunds:
      return "insufficient_funds";
    case Outcome::kUnknownTransaction:
      return "unknown_transaction";
    case Outcome::kAlreadyDisputed:
      return "already_disputed";
    case Outcome::kNotDisputed:
      return "not_disputed";
  }
  return "unknown";
}

TransactionProcessor::TransactionProcessor(std::shared_ptr<ledger::LedgerState> ledger)
    : ledger_(std::move(ledger)) {
  if (!ledger_) {
    throw std::invalid_argument("transaction processor requires a ledger");
  }
}

Outcome TransactionProcessor::apply(const TransactionRecord& record) {
  switch (record.kind) {
    case TransactionKind::kDeposit:
    case TransactionKind::kWithdrawal:
      return apply_monetary(record);
    case TransactionKind::kDispute:
      return apply_dispute(record);
    case TransactionKind::kResolve:
      return apply_resolve(record);
    case TransactionKind::kChargeback:
      return apply_chargeback(record);
  }
  return Outcome::kApplied;
}

Outcome TransactionProcessor::apply_monetary(const TransactionRecord& record) {
  Outcome outcome = Outcome::kApplied;
  ledger_->with_account(record.client, [&](Account& account) {
    if (account.locked) {
      outcome = Outcome::kIgnoredLocked;
      return;
    }

    if (record.kind == TransactionKind::kDeposit) {
      account.available += record.amount;
    } else if (account.available >= record.amount) {
      account.available -= record.amount;
    } else {
      outcome = Outcome::kInsufficientFunds;
    }

    // Stored even when the withdrawal did not go through, so a later dispute
    // can still find it.
    TransactionRecord stored = record;
    stored.disputed = false;
    ledger_->store_transaction(stored);
  });
  return outcome;
}

Outcome TransactionProcessor::apply_dispute(const TransactionRecord& record) {
  Outcome outcome = Outcome::kApplied;
  ledger_->with_account_and_transaction(record.client, record.tx, [&](Account& account, TransactionRecord* stored) {
    if (account.locked) {
      outcome = Outcome::kIgnoredLocked;
      return;
    }
    if (stored == nullptr) {
      outcome = Outcome::kUnknownTransaction;
      return;
    }
    // A second dispute must not move the amount into held again.
    if (stored->disputed) {
      outcome = Outcome::kAlreadyDisputed;
      return;
    }
    if (stored->client != record.client) {
      common::logger()->debug("client {} disputes tx {} which belongs to client {}",
                              record.client, record.tx, stored->client);
    }
    account.available -= stored->amount;
    account.held += stored->amount;
    stored->disputed = true;
  });
  return outcome;
}

Outcome TransactionProcessor::apply_resolve(const TransactionRecord& record) {
  Outcome outcome = Outcome::kApplied;
  ledger_->with_account_and_transaction(record.client, record.tx, [&](Account& account, TransactionRecord* stored) {
    if (account.locked) {
      outcome = Outcome::kIgnoredLocked;
      return;
    }
    if (stored == nullptr) {
      outcome = Outcome::kUnknownTransaction;
      return;
    }
    if (!stored->disputed) {
      outcome = Outcome::kNotDisputed;
      return;
    }
    account.available += stored->amount;
    account.held -= stored->amount;
    stored->disputed = false;
  });
  return outcome;
}

Outcome TransactionProcessor::apply_chargeback(const TransactionRecord& record) {
  Outcome outcome = Outcome::kApplied;
  ledger_->with_account_and_transaction(record.client, record.tx, [&](Account& account, TransactionRecord* stored) {
    if (account.locked) {
      outcome = Outcome::kIgnoredLocked;
      return;
    }
    if (stored == nullptr) {
      outcome = Outcome::kUnknownTransaction;
      return;
    }
    if (!stored->disputed) {
      outcome = Outcome::kNotDisputed;
      return;
    }
    // The stored record keeps its disputed flag.
    account.locked = true;
    account.held -= stored->amount;
  });
  return outcome;
}

}  // namespace processor
}  // namespace payledger
