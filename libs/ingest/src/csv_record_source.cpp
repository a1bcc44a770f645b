#include "payledger/ingest/csv_record_source.hpp"

#include <charconv>
#include <fstream>
#include <system_error>
#include <utility>

namespace payledger {
namespace ingest {

namespace {

constexpr bool is_space(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string_view trim(std::string_view text) {
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  T value{};
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::string_view field_at(const std::vector<std::string_view>& fields, std::size_t index) {
  return index < fields.size() ? fields[index] : std::string_view{};
}

}  // namespace

std::vector<std::string_view> split_csv_line(std::string_view line) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  bool quoted = false;
  for (std::size_t i = 0; i <= line.size(); ++i) {
    if (i < line.size() && line[i] == '"') {
      quoted = !quoted;
      continue;
    }
    if (i < line.size() && (quoted || line[i] != ',')) {
      continue;
    }
    auto field = trim(line.substr(start, i - start));
    if (field.size() >= 2 && field.front() == '"' && field.back() == '"') {
      field = trim(field.substr(1, field.size() - 2));
    }
    fields.push_back(field);
    start = i + 1;
  }
  return fields;
}

CsvRecordSource::CsvRecordSource(std::unique_ptr<std::istream> input, std::string name, CsvOptions options)
    : input_(std::move(input)), name_(std::move(name)), options_(options) {
  if (!input_) {
    throw SourceError("no input stream for " + name_);
  }
}

std::unique_ptr<CsvRecordSource> CsvRecordSource::open(const std::filesystem::path& path, CsvOptions options) {
  auto file = std::make_unique<std::ifstream>(path);
  if (!file->is_open()) {
    throw SourceError("failed to open " + path.string());
  }
  return std::make_unique<CsvRecordSource>(std::move(file), path.string(), options);
}

bool CsvRecordSource::read_line(std::string& out) {
  while (std::getline(*input_, out)) {
    ++line_;
    if (!trim(out).empty()) {
      return true;
    }
  }
  if (input_->bad()) {
    throw SourceError("read error in " + name_ + " after line " + std::to_string(line_));
  }
  return false;
}

bool CsvRecordSource::read_header() {
  if (!read_line(buffer_)) {
    return false;
  }

  // Strip a UTF-8 byte order mark left by spreadsheet exports.
  std::string_view header = buffer_;
  if (header.substr(0, 3) == "\xEF\xBB\xBF") {
    header.remove_prefix(3);
  }

  std::optional<std::size_t> type;
  std::optional<std::size_t> client;
  std::optional<std::size_t> tx;
  std::optional<std::size_t> amount;
  const auto names = split_csv_line(header);
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (names[i] == "type") {
      type = i;
    } else if (names[i] == "client") {
      client = i;
    } else if (names[i] == "tx") {
      tx = i;
    } else if (names[i] == "amount") {
      amount = i;
    }
  }

  if (!type || !client || !tx) {
    throw SourceError(name_ + ": header must name type, client and tx columns");
  }

  columns_ = Columns{.type = *type, .client = *client, .tx = *tx, .amount = amount};
  return true;
}

bool CsvRecordSource::next(ledger::TransactionRecord& out) {
  if (!columns_ && !read_header()) {
    return false;
  }
  if (!read_line(buffer_)) {
    return false;
  }
  out = decode_row(split_csv_line(buffer_));
  return true;
}

ledger::TransactionRecord CsvRecordSource::decode_row(const std::vector<std::string_view>& fields) const {
  const auto type_text = field_at(fields, columns_->type);
  const auto kind = ledger::kind_from_string(type_text);
  if (!kind) {
    throw RowError(line_, "unrecognized transaction type '" + std::string(type_text) + "'");
  }

  const auto client = parse_unsigned<common::ClientId>(field_at(fields, columns_->client));
  if (!client) {
    throw RowError(line_, "invalid client '" + std::string(field_at(fields, columns_->client)) + "'");
  }

  const auto tx = parse_unsigned<common::TransactionId>(field_at(fields, columns_->tx));
  if (!tx) {
    throw RowError(line_, "invalid tx '" + std::string(field_at(fields, columns_->tx)) + "'");
  }

  ledger::TransactionRecord record{.kind = *kind, .client = *client, .tx = *tx};
  if (ledger::is_monetary(*kind)) {
    const auto amount_text = columns_->amount ? field_at(fields, *columns_->amount) : std::string_view{};
    if (options_.strict_amounts) {
      const auto amount = common::Amount::parse(amount_text);
      if (!amount) {
        throw RowError(line_, "invalid amount '" + std::string(amount_text) + "'");
      }
      record.amount = *amount;
    } else {
      record.amount = common::Amount::from_decimal_string(amount_text);
    }
  }
  return record;
}

}  // namespace ingest
}  // namespace payledger
