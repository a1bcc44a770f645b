#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "payledger/ingest/record_source.hpp"

namespace payledger {
namespace ingest {

struct CsvOptions {
  // Reject deposit/withdrawal rows whose amount is not a decimal numeral
  // instead of reading it as zero.
  bool strict_amounts{false};
};

// Decodes "type, client, tx, amount" rows. Columns are located by the header
// line, fields are trimmed, empty lines are skipped and short rows are
// accepted as long as type, client and tx are present.
class CsvRecordSource : public RecordSource {
 public:
  CsvRecordSource(std::unique_ptr<std::istream> input, std::string name, CsvOptions options = {});

  // Throws SourceError when the file cannot be opened.
  [[nodiscard]] static std::unique_ptr<CsvRecordSource> open(const std::filesystem::path& path,
                                                             CsvOptions options = {});

  bool next(ledger::TransactionRecord& out) override;
  [[nodiscard]] const std::string& name() const override { return name_; }
  [[nodiscard]] std::size_t line() const noexcept { return line_; }

 private:
  struct Columns {
    std::size_t type{0};
    std::size_t client{0};
    std::size_t tx{0};
    std::optional<std::size_t> amount{};
  };

  bool read_line(std::string& out);
  bool read_header();
  ledger::TransactionRecord decode_row(const std::vector<std::string_view>& fields) const;

  std::unique_ptr<std::istream> input_;
  std::string name_;
  CsvOptions options_;
  std::optional<Columns> columns_{};
  std::size_t line_{0};
  std::string buffer_{};
};

// Splits on commas outside double quotes, trims surrounding whitespace and
// strips one pair of enclosing double quotes from each field. Doubled quotes
// inside a field are not unescaped.
[[nodiscard]] std::vector<std::string_view> split_csv_line(std::string_view line);

}  // namespace ingest
}  // namespace payledger
