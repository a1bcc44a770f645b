#include "payledger/ingest/ingestion_coordinator.hpp"

#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include "payledger/common/logging.hpp"
#include "payledger/processor/transaction_processor.hpp"
#include "payledger/snapshot/account_writer.hpp"

namespace payledger {
namespace ingest {

IngestionCoordinator::IngestionCoordinator(std::shared_ptr<ledger::LedgerState> ledger)
    : ledger_(std::move(ledger)) {
  if (!ledger_) {
    throw std::invalid_argument("ingestion coordinator requires a ledger");
  }
  configure({});
}

void IngestionCoordinator::configure(const Config& config, SourceFactory factory) {
  config_ = config;
  if (factory) {
    factory_ = std::move(factory);
    return;
  }
  const CsvOptions options{.strict_amounts = config.strict_amounts};
  factory_ = [options](const std::string& location) -> std::unique_ptr<RecordSource> {
    return CsvRecordSource::open(location, options);
  };
}

std::vector<IngestionCoordinator::StreamReport> IngestionCoordinator::run(
    const std::vector<std::string>& locations) {
  std::vector<StreamReport> reports(locations.size());
  std::vector<std::thread> workers;
  workers.reserve(locations.size());

  const auto join_all = [&workers] {
    for (auto& worker : workers) {
      worker.join();
    }
  };

  try {
    for (std::size_t i = 0; i < locations.size(); ++i) {
      reports[i].source = locations[i];
      workers.emplace_back([this, &location = locations[i], &report = reports[i]] {
        try {
          run_stream(location, report);
        } catch (const std::exception& e) {
          report.error = e.what();
          common::logger()->error("{}: worker stopped: {}", location, e.what());
        }
      });
    }
  } catch (const std::system_error& e) {
    // Workers already started still reference reports; wait for them first.
    common::logger()->critical("failed to start ingest worker: {}", e.what());
    join_all();
    throw;
  }

  join_all();
  return reports;
}

void IngestionCoordinator::run_stream(const std::string& location, StreamReport& report) const {
  auto log = common::logger();
  log->info("{}: ingest started", location);

  std::unique_ptr<RecordSource> source;
  try {
    source = factory_(location);
  } catch (const SourceError& e) {
    report.error = e.what();
    log->error("{}: {}", location, e.what());
    return;
  }

  processor::TransactionProcessor tx_processor(ledger_);
  ledger::TransactionRecord record;
  while (true) {
    try {
      if (!source->next(record)) {
        break;
      }
    } catch (const RowError& e) {
      ++report.rows_malformed;
      if (config_.on_malformed_row == MalformedRowPolicy::kAbortStream) {
        report.error = e.what();
        log->error("{}: malformed row, abandoning stream: {}", location, e.what());
        return;
      }
      log->warn("{}: skipping malformed row: {}", location, e.what());
      continue;
    } catch (const SourceError& e) {
      report.error = e.what();
      log->error("{}: {}", location, e.what());
      return;
    }

    ++report.rows_read;
    const auto outcome = tx_processor.apply(record);
    if (outcome == processor::Outcome::kApplied) {
      ++report.rows_applied;
    } else {
      ++report.rows_ignored;
      log->debug("{}: {} client={} tx={} ignored: {}", location, ledger::to_string(record.kind),
                 record.client, record.tx, processor::to_string(outcome));
    }
  }

  report.completed = true;
  log->info("{}: ingest finished, {} rows ({} applied, {} ignored, {} malformed)", location,
            report.rows_read, report.rows_applied, report.rows_ignored, report.rows_malformed);
}

void IngestionCoordinator::export_accounts(std::ostream& out, bool include_header) const {
  const auto accounts = ledger_->snapshot_accounts();
  snapshot::AccountCsvWriter writer(out, include_header);
  writer.write(accounts);
  common::logger()->info("exported {} accounts", accounts.size());
}

}  // namespace ingest
}  // namespace payledger
