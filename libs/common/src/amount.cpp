#include "payledger/common/amount.hpp"

#include <cstdint>
#include <limits>

namespace payledger {
namespace common {

namespace {

constexpr std::uint64_t kMaxMagnitude = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
constexpr std::uint64_t kMaxWhole = (kMaxMagnitude - static_cast<std::uint64_t>(Amount::kScale)) /
                                    static_cast<std::uint64_t>(Amount::kScale);

constexpr bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}

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

}  // namespace

std::optional<Amount> Amount::parse(std::string_view text) {
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }

  std::size_t pos = 0;
  bool negative = false;
  if (text[pos] == '+' || text[pos] == '-') {
    negative = text[pos] == '-';
    ++pos;
  }

  bool saw_digit = false;
  std::uint64_t whole = 0;
  while (pos < text.size() && is_digit(text[pos])) {
    whole = whole * 10 + static_cast<std::uint64_t>(text[pos] - '0');
    if (whole > kMaxWhole) {
      return std::nullopt;
    }
    saw_digit = true;
    ++pos;
  }

  std::uint64_t fraction = 0;
  int kept_digits = 0;
  bool round_up = false;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    bool first_dropped = true;
    while (pos < text.size() && is_digit(text[pos])) {
      const auto digit = static_cast<std::uint64_t>(text[pos] - '0');
      if (kept_digits < kFractionDigits) {
        fraction = fraction * 10 + digit;
        ++kept_digits;
      } else if (first_dropped) {
        // Half away from zero: only the first dropped digit decides.
        round_up = digit >= 5;
        first_dropped = false;
      }
      saw_digit = true;
      ++pos;
    }
  }

  if (!saw_digit || pos != text.size()) {
    return std::nullopt;
  }

  for (; kept_digits < kFractionDigits; ++kept_digits) {
    fraction *= 10;
  }

  std::uint64_t magnitude = whole * static_cast<std::uint64_t>(kScale) + fraction;
  if (round_up) {
    ++magnitude;
  }

  const auto signed_magnitude = static_cast<std::int64_t>(magnitude);
  return Amount::from_raw(negative ? -signed_magnitude : signed_magnitude);
}

Amount Amount::from_decimal_string(std::string_view text) {
  return parse(text).value_or(Amount{});
}

std::string Amount::to_decimal_string() const {
  const bool negative = raw_ < 0;
  const std::uint64_t magnitude =
      negative ? std::uint64_t{0} - static_cast<std::uint64_t>(raw_) : static_cast<std::uint64_t>(raw_);
  const std::uint64_t whole = magnitude / static_cast<std::uint64_t>(kScale);
  const std::uint64_t fraction = magnitude % static_cast<std::uint64_t>(kScale);

  std::string fraction_text = std::to_string(fraction);
  fraction_text.insert(0, static_cast<std::size_t>(kFractionDigits) - fraction_text.size(), '0');
  while (fraction_text.size() > 1 && fraction_text.back() == '0') {
    fraction_text.pop_back();
  }

  std::string out;
  if (negative) {
    out.push_back('-');
  }
  out += std::to_string(whole);
  out.push_back('.');
  out += fraction_text;
  return out;
}

}  // namespace common
}  // namespace payledger
