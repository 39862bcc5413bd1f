// =============================================================================
// decimal_test.cpp
// =============================================================================
// Unit tests for tradeguard::domain::Decimal.
//
// Validates:
//   - Parsing of plain decimal literals and rejection of malformed input
//   - Canonical formatting (no exponent, trailing zeros trimmed)
//   - Exact addition / subtraction, rounded multiplication / division
//   - Overflow and division-by-zero errors
//   - The weighted-average case used by Order::partialFill
// =============================================================================

#include "tradeguard/domain/decimal.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

using tradeguard::domain::Decimal;

// -----------------------------------------------------------------------------
// 1. Parsed values keep their exact digits.
// -----------------------------------------------------------------------------
TEST(DecimalTest, ParseAndFormat) {
  EXPECT_EQ(Decimal::parse("50100.05").toString(), "50100.05");
  EXPECT_EQ(Decimal::parse("0.05").raw(), 5'000'000);
  EXPECT_EQ(Decimal::parse("-0.1").toString(), "-0.1");
  EXPECT_EQ(Decimal::parse("+1.5").toString(), "1.5");
  EXPECT_EQ(Decimal::parse("1.50000000").toString(), "1.5");
  EXPECT_EQ(Decimal::parse("0.00000001").raw(), 1);
  EXPECT_EQ(Decimal(0).toString(), "0");
  EXPECT_EQ(Decimal(50150).toString(), "50150");
}

// -----------------------------------------------------------------------------
// 2. Malformed literals are rejected.
// -----------------------------------------------------------------------------
TEST(DecimalTest, ParseRejectsMalformedInput) {
  EXPECT_THROW(Decimal::parse(""), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("1e3"), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("1.2.3"), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("."), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("-"), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("abc"), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("1.123456789"), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("99999999999999999999"), std::overflow_error);
}

// -----------------------------------------------------------------------------
// 3. Addition and subtraction are exact.
// Why: 0.1 + 0.2 != 0.3 in binary floating point; money must not drift.
// -----------------------------------------------------------------------------
TEST(DecimalTest, AdditionIsExact) {
  Decimal sum = Decimal::parse("0.1") + Decimal::parse("0.2");
  EXPECT_EQ(sum, Decimal::parse("0.3"));

  Decimal diff = Decimal::parse("0.1") - Decimal::parse("0.3");
  EXPECT_EQ(diff.toString(), "-0.2");
  EXPECT_TRUE(diff.isNegative());
  EXPECT_EQ(diff.abs(), Decimal::parse("0.2"));

  Decimal acc = Decimal(0);
  acc += Decimal::parse("0.05");
  acc += Decimal::parse("0.05");
  acc -= Decimal::parse("0.02");
  EXPECT_EQ(acc, Decimal::parse("0.08"));
}

// -----------------------------------------------------------------------------
// 4. Multiplication and division round half away from zero to 8 digits.
// -----------------------------------------------------------------------------
TEST(DecimalTest, MultiplyAndDivideRounding) {
  EXPECT_EQ(Decimal::parse("0.05") * Decimal(50100), Decimal(2505));
  EXPECT_EQ(Decimal::parse("0.1") * Decimal(50000), Decimal(5000));
  EXPECT_EQ((Decimal(1) / Decimal(3)).toString(), "0.33333333");
  EXPECT_EQ((Decimal(2) / Decimal(3)).toString(), "0.66666667");
  EXPECT_EQ((Decimal(-2) / Decimal(3)).toString(), "-0.66666667");
  EXPECT_EQ((Decimal::parse("0.00000001") * Decimal::parse("0.5")).raw(), 1);
}

// -----------------------------------------------------------------------------
// 5. (0.05 * 50100 + 0.05 * 50200) / 0.1 == 50150 exactly.
// -----------------------------------------------------------------------------
TEST(DecimalTest, WeightedAverageIsExact) {
  Decimal q = Decimal::parse("0.05");
  Decimal avg = (q * Decimal(50100) + q * Decimal(50200)) / (q + q);
  EXPECT_EQ(avg, Decimal(50150));
}

// -----------------------------------------------------------------------------
// 6. Out-of-range results and division by zero throw.
// -----------------------------------------------------------------------------
TEST(DecimalTest, OverflowAndDivisionByZero) {
  Decimal max = Decimal::fromRaw(std::numeric_limits<std::int64_t>::max());
  EXPECT_THROW(max + Decimal::fromRaw(1), std::overflow_error);
  EXPECT_THROW(max * Decimal(2), std::overflow_error);
  EXPECT_THROW(Decimal(1) / Decimal(0), std::domain_error);
}

// -----------------------------------------------------------------------------
// 7. fromDouble rounds to the nearest 1e-8; toDouble converts back.
// -----------------------------------------------------------------------------
TEST(DecimalTest, DoubleConversion) {
  EXPECT_EQ(Decimal::fromDouble(0.1), Decimal::parse("0.1"));
  EXPECT_EQ(Decimal::fromDouble(0.001), Decimal::fromRaw(100'000));
  EXPECT_DOUBLE_EQ(Decimal::parse("50150.5").toDouble(), 50150.5);
  EXPECT_THROW(Decimal::fromDouble(1e300), std::overflow_error);
}

// -----------------------------------------------------------------------------
// 8. Ordering and stream output.
// -----------------------------------------------------------------------------
TEST(DecimalTest, ComparisonAndStream) {
  EXPECT_LT(Decimal::parse("0.1"), Decimal::parse("0.2"));
  EXPECT_GT(Decimal(0), Decimal::parse("-0.00000001"));
  EXPECT_LE(Decimal(5), Decimal(5));
  EXPECT_NE(Decimal(5), Decimal(6));

  std::ostringstream os;
  os << Decimal::parse("12.340");
  EXPECT_EQ(os.str(), "12.34");
}
