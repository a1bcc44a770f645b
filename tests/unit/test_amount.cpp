#include "test_amount.hpp"

#include <cassert>
#include "payledger/common/amount.hpp"

namespace payledger::tests {

using common::Amount;

void test_amount_scaled_integer() {
  const auto amount = Amount::from_decimal_string("5.1234");
  assert(amount.raw() == 51234);
  assert(amount.to_decimal_string() == "5.1234");

  assert(Amount::from_decimal_string("3").raw() == 30000);
  assert(Amount::from_decimal_string("3.0").raw() == 30000);
  assert(Amount::from_decimal_string(" 2.5 ").raw() == 25000);
  assert(Amount::from_decimal_string(".5").raw() == 5000);
  assert(Amount::from_decimal_string("7.").raw() == 70000);
  assert(Amount::from_decimal_string("+1.25").raw() == 12500);
  assert(Amount::from_decimal_string("-1.25").raw() == -12500);

  const auto sum = Amount::from_decimal_string("0.1") + Amount::from_decimal_string("0.2");
  assert(sum == Amount::from_decimal_string("0.3"));
  assert(Amount::from_decimal_string("1.0") - Amount::from_decimal_string("1.0001") == Amount::from_raw(-1));
}

void test_amount_rounding() {
  assert(Amount::from_decimal_string("1.00004").raw() == 10000);
  assert(Amount::from_decimal_string("1.00005").raw() == 10001);
  assert(Amount::from_decimal_string("1.00009999").raw() == 10001);
  assert(Amount::from_decimal_string("-1.00005").raw() == -10001);
  assert(Amount::from_decimal_string("-1.00004").raw() == -10000);
  assert(Amount::from_decimal_string("0.99995").raw() == 10000);
  // Only the first dropped digit decides.
  assert(Amount::from_decimal_string("2.00004999").raw() == 20000);
}

void test_amount_lenient_and_strict_parse() {
  assert(!Amount::parse("").has_value());
  assert(!Amount::parse("   ").has_value());
  assert(!Amount::parse("abc").has_value());
  assert(!Amount::parse("1.2.3").has_value());
  assert(!Amount::parse("-").has_value());
  assert(!Amount::parse(".").has_value());
  assert(!Amount::parse("1e3").has_value());
  assert(!Amount::parse("99999999999999999999").has_value());

  assert(Amount::from_decimal_string("abc").is_zero());
  assert(Amount::from_decimal_string("").is_zero());
  assert(Amount::from_decimal_string("99999999999999999999").is_zero());

  const auto parsed = Amount::parse("42.42");
  assert(parsed.has_value());
  assert(parsed->raw() == 424200);
}

void test_amount_rendering() {
  assert(Amount{}.to_decimal_string() == "0.0");
  assert(Amount::from_raw(30000).to_decimal_string() == "3.0");
  assert(Amount::from_raw(15000).to_decimal_string() == "1.5");
  assert(Amount::from_raw(1).to_decimal_string() == "0.0001");
  assert(Amount::from_raw(-5000).to_decimal_string() == "-0.5");
  assert(Amount::from_raw(-123456).to_decimal_string() == "-12.3456");
  assert(Amount::from_raw(1000000).to_decimal_string() == "100.0");

  for (const char* text : {"5.1234", "0.0001", "-7.25", "1000000.5"}) {
    assert(Amount::from_decimal_string(text).to_decimal_string() == text);
  }
}

}  // namespace payledger::tests
