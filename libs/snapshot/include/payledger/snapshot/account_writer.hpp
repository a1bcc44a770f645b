#pragma once

#include <ostream>
#include <span>

#include "payledger/ledger/account.hpp"

namespace payledger {
namespace snapshot {

// Encodes account snapshots as "client,available,held,total,locked" rows.
class AccountCsvWriter {
 public:
  explicit AccountCsvWriter(std::ostream& out, bool include_header = true);

  // Throws std::runtime_error when the stream rejects the write.
  void write(std::span<const ledger::AccountSnapshot> accounts);

 private:
  void write_row(const ledger::AccountSnapshot& account);

  std::ostream& out_;
  bool include_header_;
};

}  // namespace snapshot
}  // namespace payledger
