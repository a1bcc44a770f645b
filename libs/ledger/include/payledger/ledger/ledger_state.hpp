#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "payledger/common/types.hpp"
#include "payledger/ledger/account.hpp"
#include "payledger/ledger/transaction.hpp"

namespace payledger {
namespace ledger {

// Accounts and transaction history shared by every ingestion worker.
//
// The two maps have their own mutexes. When both are needed the accounts
// mutex is always taken first. Callbacks run with the lock(s) held and must
// not call back into the ledger, except for store_transaction() from inside
// with_account().
class LedgerState {
 public:
  using AccountFn = std::function<void(Account&)>;
  using TransactionFn = std::function<void(TransactionRecord&)>;
  using AccountTransactionFn = std::function<void(Account&, TransactionRecord*)>;

  LedgerState() = default;
  LedgerState(const LedgerState&) = delete;
  LedgerState& operator=(const LedgerState&) = delete;

  // Creates the account on first reference.
  void with_account(common::ClientId client, const AccountFn& fn);

  // Holds both locks for the duration of fn. The record pointer is null when
  // tx has never been stored.
  void with_account_and_transaction(common::ClientId client,
                                    common::TransactionId tx,
                                    const AccountTransactionFn& fn);

  // Returns false, without calling fn, when tx is unknown.
  bool with_stored_transaction(common::TransactionId tx, const TransactionFn& fn);
  [[nodiscard]] std::optional<TransactionRecord> stored_transaction(common::TransactionId tx) const;

  // Overwrites any record already stored under record.tx.
  void store_transaction(const TransactionRecord& record);

  // Ordered by client id.
  [[nodiscard]] std::vector<AccountSnapshot> snapshot_accounts() const;
  [[nodiscard]] std::optional<AccountSnapshot> snapshot_account(common::ClientId client) const;

  [[nodiscard]] std::size_t account_count() const;
  [[nodiscard]] std::size_t transaction_count() const;

 private:
  Account& account_locked(common::ClientId client);

  mutable std::mutex accounts_mutex_;
  mutable std::mutex transactions_mutex_;
  std::unordered_map<common::ClientId, Account> accounts_{};
  std::unordered_map<common::TransactionId, TransactionRecord> transactions_{};
};

}  // namespace ledger
}  // namespace payledger
