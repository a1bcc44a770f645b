#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "payledger/common/logging.hpp"
#include "payledger/config/config_loader.hpp"
#include "payledger/ingest/ingestion_coordinator.hpp"
#include "payledger/ledger/ledger_state.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [--config <file>] <transactions.csv>...\n"
            << "  --config <file>: Path to TOML configuration file\n"
            << "                   If not specified, built-in defaults are used\n"
            << "  Final account balances are written to stdout as CSV.\n";
}

struct CommandLine {
  std::filesystem::path config_path;
  std::vector<std::string> inputs;
  bool show_help{false};
  bool valid{true};
};

CommandLine parse_command_line(int argc, char* argv[]) {
  CommandLine cmd;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if (arg == "--help" || arg == "-h") {
      cmd.show_help = true;
    } else if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        cmd.valid = false;
        break;
      }
      cmd.config_path = argv[++i];
    } else {
      cmd.inputs.emplace_back(arg);
    }
  }
  return cmd;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace payledger;

  const auto cmd = parse_command_line(argc, argv);
  if (cmd.show_help || !cmd.valid) {
    print_usage(argv[0]);
    return cmd.valid ? 0 : 2;
  }

  auto log = common::logger();

  auto result = cmd.config_path.empty()
                    ? config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default())
                    : config::ConfigLoader::load(cmd.config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      log->critical("Config error: {}", result.raw_error);
    }
    for (const auto& err : result.errors) {
      log->critical("Validation error [{}]: {}", err.field, err.message);
    }
    return 1;
  }
  const auto cfg = std::move(result.config);

  if (auto level = common::parse_log_level(cfg.logging.level)) {
    log->set_level(*level);
  }
  log->info("{} input stream(s), malformed rows: {}, strict amounts: {}", cmd.inputs.size(),
            cfg.ingest.on_malformed_row, cfg.ingest.strict_amounts);

  auto ledger = std::make_shared<ledger::LedgerState>();
  ingest::IngestionCoordinator coordinator(ledger);
  coordinator.configure({
      .on_malformed_row = cfg.ingest.on_malformed_row == "skip" ? ingest::MalformedRowPolicy::kSkipRow
                                                                : ingest::MalformedRowPolicy::kAbortStream,
      .strict_amounts = cfg.ingest.strict_amounts,
  });

  std::vector<ingest::IngestionCoordinator::StreamReport> reports;
  try {
    reports = coordinator.run(cmd.inputs);
  } catch (const std::system_error& e) {
    log->critical("Ingest failed: {}", e.what());
    return 1;
  }
  for (const auto& report : reports) {
    if (!report.completed) {
      log->warn("{}: incomplete after {} rows: {}", report.source, report.rows_read, report.error);
    }
  }

  try {
    coordinator.export_accounts(std::cout, cfg.output.include_header);
  } catch (const std::exception& e) {
    log->critical("Export failed: {}", e.what());
    return 1;
  }

  return 0;
}
