#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "payledger/ingest/csv_record_source.hpp"
#include "payledger/ingest/record_source.hpp"
#include "payledger/ledger/ledger_state.hpp"

namespace payledger {
namespace ingest {

enum class MalformedRowPolicy : std::uint8_t {
  kAbortStream,
  kSkipRow,
};

// Replays every input stream into one shared ledger, one thread per stream.
class IngestionCoordinator {
 public:
  struct Config {
    MalformedRowPolicy on_malformed_row{MalformedRowPolicy::kAbortStream};
    bool strict_amounts{false};
  };

  struct StreamReport {
    std::string source;
    std::uint64_t rows_read{0};
    std::uint64_t rows_applied{0};
    std::uint64_t rows_ignored{0};
    std::uint64_t rows_malformed{0};
    bool completed{false};
    std::string error;
  };

  using SourceFactory = std::function<std::unique_ptr<RecordSource>(const std::string& location)>;

  explicit IngestionCoordinator(std::shared_ptr<ledger::LedgerState> ledger);

  // Without a factory, locations are opened as CSV files.
  void configure(const Config& config, SourceFactory factory = SourceFactory{});

  // Blocks until every stream has finished or failed. Reports are in the
  // order of locations.
  std::vector<StreamReport> run(const std::vector<std::string>& locations);

  // Throws std::runtime_error when the output stream fails.
  void export_accounts(std::ostream& out, bool include_header = true) const;

 private:
  void run_stream(const std::string& location, StreamReport& report) const;

  std::shared_ptr<ledger::LedgerState> ledger_;
  Config config_{};
  SourceFactory factory_{};
};

}  // namespace ingest
}  // namespace payledger
