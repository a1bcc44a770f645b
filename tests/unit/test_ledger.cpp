#include "test_ledger.hpp"

#include <cassert>
#include <memory>
#include <thread>
#include <vector>
#include "payledger/ledger/ledger_state.hpp"

namespace payledger::tests {

using common::Amount;
using ledger::Account;
using ledger::LedgerState;
using ledger::TransactionKind;
using ledger::TransactionRecord;

void test_ledger_accounts_created_on_demand() {
  LedgerState ledger;
  assert(ledger.account_count() == 0);
  assert(!ledger.snapshot_account(7).has_value());

  ledger.with_account(7, [](Account& account) {
    assert(account.client == 7);
    assert(account.available.is_zero());
    assert(account.held.is_zero());
    assert(!account.locked);
    account.available += Amount::from_raw(100);
  });
  ledger.with_account(7, [](Account& account) { account.available -= Amount::from_raw(10); });

  assert(ledger.account_count() == 1);
  const auto account = ledger.snapshot_account(7);
  assert(account.has_value());
  assert(account->available.raw() == 90);
}

void test_ledger_stored_transactions() {
  LedgerState ledger;
  assert(!ledger.stored_transaction(1).has_value());
  assert(!ledger.with_stored_transaction(1, [](TransactionRecord&) { assert(false); }));

  ledger.store_transaction({.kind = TransactionKind::kDeposit, .client = 1, .tx = 1, .amount = Amount::from_raw(500)});
  assert(ledger.transaction_count() == 1);

  const bool found = ledger.with_stored_transaction(1, [](TransactionRecord& record) { record.disputed = true; });
  assert(found);
  assert(ledger.stored_transaction(1)->disputed);

  // A second monetary record under the same tx replaces the first.
  ledger.store_transaction({.kind = TransactionKind::kWithdrawal, .client = 2, .tx = 1, .amount = Amount::from_raw(7)});
  assert(ledger.transaction_count() == 1);
  const auto replaced = ledger.stored_transaction(1);
  assert(replaced->kind == TransactionKind::kWithdrawal);
  assert(replaced->client == 2);
  assert(replaced->amount.raw() == 7);
  assert(!replaced->disputed);

  bool saw_record = false;
  ledger.with_account_and_transaction(3, 1, [&](Account& account, TransactionRecord* stored) {
    assert(account.client == 3);
    assert(stored != nullptr);
    saw_record = stored->tx == 1;
  });
  assert(saw_record);

  ledger.with_account_and_transaction(3, 99, [](Account&, TransactionRecord* stored) { assert(stored == nullptr); });
}

void test_ledger_snapshot_totals_and_order() {
  LedgerState ledger;
  for (common::ClientId client : {5, 1, 3}) {
    ledger.with_account(client, [client](Account& account) {
      account.available = Amount::from_raw(client * 10);
      account.held = Amount::from_raw(client);
      account.locked = client == 3;
    });
  }

  const auto snapshot = ledger.snapshot_accounts();
  assert(snapshot.size() == 3);
  assert(snapshot[0].client == 1);
  assert(snapshot[1].client == 3);
  assert(snapshot[2].client == 5);
  assert(snapshot[1].total.raw() == 33);
  assert(snapshot[1].locked);
  assert(snapshot[2].total.raw() == 55);

  // Negative held still sums into total.
  ledger.with_account(1, [](Account& account) { account.held = Amount::from_raw(-30); });
  assert(ledger.snapshot_account(1)->total.raw() == -20);
}

void test_ledger_concurrent_access() {
  auto ledger = std::make_shared<LedgerState>();
  constexpr int kThreads = 8;
  constexpr int kPerThread = 1000;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([ledger, t] {
      for (int i = 0; i < kPerThread; ++i) {
        ledger->with_account(static_cast<common::ClientId>(i % 4), [](Account& account) {
          account.available += Amount::from_raw(Amount::kScale);
        });
        ledger->store_transaction({.kind = TransactionKind::kDeposit,
                                   .client = static_cast<common::ClientId>(i % 4),
                                   .tx = static_cast<common::TransactionId>(t * kPerThread + i),
                                   .amount = Amount::from_raw(Amount::kScale)});
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  assert(ledger->account_count() == 4);
  assert(ledger->transaction_count() == static_cast<std::size_t>(kThreads * kPerThread));
  Amount total{};
  for (const auto& account : ledger->snapshot_accounts()) {
    assert(account.available.raw() == (kThreads * kPerThread / 4) * Amount::kScale);
    total += account.total;
  }
  assert(total.raw() == kThreads * kPerThread * Amount::kScale);
}

}  // namespace payledger::tests
