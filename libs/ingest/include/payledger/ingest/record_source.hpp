#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include "payledger/ledger/transaction.hpp"

namespace payledger {
namespace ingest {

// The stream cannot be opened or read any further.
class SourceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// One row could not be decoded into a TransactionRecord. The source has
// consumed the row and may be asked for the next one.
class RowError : public std::runtime_error {
 public:
  RowError(std::size_t line, const std::string& message)
      : std::runtime_error("line " + std::to_string(line) + ": " + message), line_(line) {}

  [[nodiscard]] std::size_t line() const noexcept { return line_; }

 private:
  std::size_t line_;
};

// Finite, non-restartable sequence of decoded records.
class RecordSource {
 public:
  virtual ~RecordSource() = default;

  // Returns false once the stream is exhausted. Throws RowError or SourceError.
  virtual bool next(ledger::TransactionRecord& out) = 0;
  [[nodiscard]] virtual const std::string& name() const = 0;
};

}  // namespace ingest
}  // namespace payledger
