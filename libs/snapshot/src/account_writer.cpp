#include "payledger/snapshot/account_writer.hpp"

#include <stdexcept>

namespace payledger {
namespace snapshot {

AccountCsvWriter::AccountCsvWriter(std::ostream& out, bool include_header)
    : out_(out), include_header_(include_header) {}

void AccountCsvWriter::write(std::span<const ledger::AccountSnapshot> accounts) {
  if (include_header_) {
    out_ << "client,available,held,total,locked\n";
  }
  for (const auto& account : accounts) {
    write_row(account);
  }
  out_.flush();
  if (!out_) {
    throw std::runtime_error("failed to write account snapshot");
  }
}

void AccountCsvWriter::write_row(const ledger::AccountSnapshot& account) {
  out_ << account.client << ','
       << account.available.to_decimal_string() << ','
       << account.held.to_decimal_string() << ','
       << account.total.to_decimal_string() << ','
       << (account.locked ? "true" : "false") << '\n';
  if (!out_) {
    throw std::runtime_error("failed to write account row for client " + std::to_string(account.client));
  }
}

}  // namespace snapshot
}  // namespace payledger
