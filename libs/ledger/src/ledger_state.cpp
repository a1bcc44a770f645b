#include "payledger/ledger/ledger_state.hpp"

#include <algorithm>

namespace payledger {
namespace ledger {

Account& LedgerState::account_locked(common::ClientId client) {
  auto [it, inserted] = accounts_.try_emplace(client, Account{.client = client});
  return it->second;
}

void LedgerState::with_account(common::ClientId client, const AccountFn& fn) {
  std::scoped_lock lock(accounts_mutex_);
  fn(account_locked(client));
}

void LedgerState::with_account_and_transaction(common::ClientId client,
                                               common::TransactionId tx,
                                               const AccountTransactionFn& fn) {
  std::scoped_lock accounts_lock(accounts_mutex_);
  std::scoped_lock transactions_lock(transactions_mutex_);
  auto& account = account_locked(client);
  TransactionRecord* stored = nullptr;
  if (auto it = transactions_.find(tx); it != transactions_.end()) {
    stored = &it->second;
  }
  fn(account, stored);
}

bool LedgerState::with_stored_transaction(common::TransactionId tx, const TransactionFn& fn) {
  std::scoped_lock lock(transactions_mutex_);
  auto it = transactions_.find(tx);
  if (it == transactions_.end()) {
    return false;
  }
  fn(it->second);
  return true;
}

std::optional<TransactionRecord> LedgerState::stored_transaction(common::TransactionId tx) const {
  std::scoped_lock lock(transactions_mutex_);
  if (auto it = transactions_.find(tx); it != transactions_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void LedgerState::store_transaction(const TransactionRecord& record) {
  std::scoped_lock lock(transactions_mutex_);
  transactions_.insert_or_assign(record.tx, record);
}

std::vector<AccountSnapshot> LedgerState::snapshot_accounts() const {
  std::vector<AccountSnapshot> out;
  {
    std::scoped_lock lock(accounts_mutex_);
    out.reserve(accounts_.size());
    for (const auto& [client, account] : accounts_) {
      out.push_back(make_snapshot(account));
    }
  }
  std::sort(out.begin(), out.end(), [](const AccountSnapshot& lhs, const AccountSnapshot& rhs) {
    return lhs.client < rhs.client;
  });
  return out;
}

std::optional<AccountSnapshot> LedgerState::snapshot_account(common::ClientId client) const {
  std::scoped_lock lock(accounts_mutex_);
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return make_snapshot(it->second);
  }
  return std::nullopt;
}

std::size_t LedgerState::account_count() const {
  std::scoped_lock lock(accounts_mutex_);
  return accounts_.size();
}

std::size_t LedgerState::transaction_count() const {
  std::scoped_lock lock(transactions_mutex_);
  return transactions_.size();
}

}  // namespace ledger
}  // namespace payledger
