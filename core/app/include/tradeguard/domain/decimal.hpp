#pragma once

#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>

namespace tradeguard {
namespace domain {

// -----------------------------------------------------------------------------
// Decimal: signed fixed-point number with 8 fractional digits
// -----------------------------------------------------------------------------
//
// @brief  Exact decimal arithmetic for prices, quantities and money.
//
// @details
// The value is stored as a raw int64_t count of 1e-8 units, so 0.05 is held
// as 5'000'000 and 50100 as 5'010'000'000'000. Addition and subtraction are
// exact. Multiplication and division use a 128-bit intermediate and round
// half away from zero back to 8 digits, which keeps weighted averages such
// as (0.05 * 50100 + 0.05 * 50200) / 0.1 == 50150 exact.
//
// Range: roughly +/- 9.2e10. Results outside the int64_t range throw
// std::overflow_error instead of wrapping.
//
// Thread model:
//   Value type. Safe to copy between threads.
// -----------------------------------------------------------------------------
class Decimal {
 public:
  static constexpr int kScale = 8;
  static constexpr std::int64_t kUnit = 100'000'000;  // 10^kScale

  constexpr Decimal() = default;

  // Whole-number constructor: Decimal(5) == 5.00000000.
  Decimal(std::int64_t whole);

  // -------------------------------------------------------------------------
  // fromRaw(raw)
  // -------------------------------------------------------------------------
  // @brief  Builds a Decimal directly from its 1e-8 unit count.
  // -------------------------------------------------------------------------
  static constexpr Decimal fromRaw(std::int64_t raw) {
    Decimal d;
    d.raw_ = raw;
    return d;
  }

  // Largest representable value, about 9.2e10.
  static constexpr Decimal max() {
    return fromRaw(std::numeric_limits<std::int64_t>::max());
  }

  // -------------------------------------------------------------------------
  // parse(text)
  // -------------------------------------------------------------------------
  // @brief  Parses a plain decimal literal ("50100", "-0.05", "+1.5").
  //
  // @throws std::invalid_argument  Empty input, exponent notation, stray
  //                                characters, or more than 8 fractional
  //                                digits.
  // @throws std::overflow_error    Value outside the representable range.
  // -------------------------------------------------------------------------
  static Decimal parse(std::string_view text);

  // -------------------------------------------------------------------------
  // fromDouble(value)
  // -------------------------------------------------------------------------
  // @brief  Rounds a double to the nearest 1e-8. Used only at configuration
  //         boundaries where JSON numbers arrive as doubles.
  // -------------------------------------------------------------------------
  static Decimal fromDouble(double value);

  constexpr std::int64_t raw() const { return raw_; }
  double toDouble() const;

  // Canonical string: no exponent, trailing fractional zeros trimmed.
  std::string toString() const;

  constexpr bool isZero() const { return raw_ == 0; }
  constexpr bool isNegative() const { return raw_ < 0; }
  constexpr bool isPositive() const { return raw_ > 0; }

  Decimal abs() const;

  Decimal operator+(Decimal other) const;
  Decimal operator-(Decimal other) const;
  Decimal operator*(Decimal other) const;
  Decimal operator/(Decimal other) const;
  Decimal operator-() const;

  Decimal& operator+=(Decimal other) { return *this = *this + other; }
  Decimal& operator-=(Decimal other) { return *this = *this - other; }

  friend constexpr bool operator==(Decimal a, Decimal b) {
    return a.raw_ == b.raw_;
  }
  friend constexpr bool operator!=(Decimal a, Decimal b) {
    return a.raw_ != b.raw_;
  }
  friend constexpr bool operator<(Decimal a, Decimal b) {
    return a.raw_ < b.raw_;
  }
  friend constexpr bool operator<=(Decimal a, Decimal b) {
    return a.raw_ <= b.raw_;
  }
  friend constexpr bool operator>(Decimal a, Decimal b) {
    return a.raw_ > b.raw_;
  }
  friend constexpr bool operator>=(Decimal a, Decimal b) {
    return a.raw_ >= b.raw_;
  }

 private:
  std::int64_t raw_{0};
};

std::ostream& operator<<(std::ostream& os, Decimal value);

}  // namespace domain
}  // namespace tradeguard
