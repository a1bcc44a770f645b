// Unit test runner - calls test functions from per-component test files

#include "test_amount.hpp"
#include "test_config.hpp"
#include "test_ingest.hpp"
#include "test_ledger.hpp"
#include "test_processor.hpp"
#include "test_snapshot.hpp"

int main() {
  using namespace payledger::tests;

  // Amount tests
  test_amount_scaled_integer();
  test_amount_rounding();
  test_amount_lenient_and_strict_parse();
  test_amount_rendering();

  // Ledger tests
  test_ledger_accounts_created_on_demand();
  test_ledger_stored_transactions();
  test_ledger_snapshot_totals_and_order();
  test_ledger_concurrent_access();

  // Processor tests
  test_processor_deposit();
  test_processor_withdrawal();
  test_processor_withdrawal_insufficient_funds();
  test_processor_deposit_withdrawal_sequence();
  test_processor_withdrawal_mid_dispute();
  test_processor_dispute_resolved();
  test_processor_resolve_wrong_tx();
  test_processor_dispute_unknown_tx();
  test_processor_double_dispute();
  test_processor_chargeback_locks_account();
  test_processor_chargeback_requires_dispute();
  test_processor_cross_client_dispute();
  test_processor_negative_available();
  test_processor_concurrent_dispute_resolve();
  test_processor_concurrent_dispute_chargeback();

  // Ingest tests
  test_csv_decodes_rows();
  test_csv_header_and_flexible_columns();
  test_csv_malformed_rows();
  test_csv_quoted_fields();
  test_csv_strict_amounts();
  test_csv_open_missing_file();
  test_coordinator_concurrent_streams();
  test_coordinator_abort_on_malformed_row();
  test_coordinator_skip_malformed_rows();
  test_coordinator_unreadable_stream();
  test_coordinator_csv_files_end_to_end();

  // Snapshot tests
  test_account_writer_rows();
  test_account_writer_stream_failure();

  // Config tests
  test_config_defaults();
  test_config_overrides();
  test_config_validation();
  test_config_load_file();

  return 0;
}
