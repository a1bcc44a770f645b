#pragma once

namespace payledger::tests {

void test_ledger_accounts_created_on_demand();
void test_ledger_stored_transactions();
void test_ledger_snapshot_totals_and_order();
void test_ledger_concurrent_access();

}  // namespace payledger::tests
