#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace payledger {
namespace common {

// Fixed-point money value: an integer count of 1/10000ths of a unit.
// Decimal text is converted exactly, without passing through floating point.
class Amount {
 public:
  static constexpr std::int64_t kScale = 10'000;
  static constexpr int kFractionDigits = 4;

  constexpr Amount() noexcept = default;

  [[nodiscard]] static constexpr Amount from_raw(std::int64_t raw) noexcept {
    Amount amount;
    amount.raw_ = raw;
    return amount;
  }

  // Rounds to the nearest 1/10000, ties away from zero. Accepts an optional
  // sign, an optional fraction and surrounding whitespace. Empty when the text
  // is not a decimal numeral or does not fit after scaling.
  [[nodiscard]] static std::optional<Amount> parse(std::string_view text);

  // Lenient form of parse(): unparseable text yields zero.
  [[nodiscard]] static Amount from_decimal_string(std::string_view text);

  // At most four fractional digits, trailing zeros trimmed, at least one kept.
  [[nodiscard]] std::string to_decimal_string() const;

  [[nodiscard]] constexpr std::int64_t raw() const noexcept { return raw_; }
  [[nodiscard]] constexpr bool is_zero() const noexcept { return raw_ == 0; }

  constexpr Amount& operator+=(Amount other) noexcept {
    raw_ += other.raw_;
    return *this;
  }

  constexpr Amount& operator-=(Amount other) noexcept {
    raw_ -= other.raw_;
    return *this;
  }

  friend constexpr Amount operator+(Amount lhs, Amount rhs) noexcept { return lhs += rhs; }
  friend constexpr Amount operator-(Amount lhs, Amount rhs) noexcept { return lhs -= rhs; }
  friend constexpr auto operator<=>(const Amount&, const Amount&) noexcept = default;

 private:
  std::int64_t raw_{0};
};

}  // namespace common
}  // namespace payledger
