#include "tradeguard/domain/decimal.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace tradeguard {
namespace domain {

namespace {

using Wide = __int128;

constexpr Wide kMaxRaw = std::numeric_limits<std::int64_t>::max();
constexpr Wide kMinRaw = std::numeric_limits<std::int64_t>::min();

// Narrows a 128-bit intermediate back to the stored width, refusing to wrap.
std::int64_t narrow(Wide value) {
  if (value > kMaxRaw || value < kMinRaw) {
    throw std::overflow_error("Decimal overflow");
  }
  return static_cast<std::int64_t>(value);
}

// Integer division rounding half away from zero.
Wide roundedDivide(Wide numerator, Wide denominator) {
  Wide quotient = numerator / denominator;
  Wide remainder = numerator % denominator;
  if (remainder == 0) {
    return quotient;
  }
  Wide abs_rem = remainder < 0 ? -remainder : remainder;
  Wide abs_den = denominator < 0 ? -denominator : denominator;
  if (abs_rem * 2 >= abs_den) {
    bool negative = (numerator < 0) != (denominator < 0);
    quotient += negative ? -1 : 1;
  }
  return quotient;
}

}  // namespace

Decimal::Decimal(std::int64_t whole)
    : raw_(narrow(static_cast<Wide>(whole) * kUnit)) {}

// -----------------------------------------------------------------------------
// parse: sign, integer digits, optional '.' and up to kScale fraction digits
// -----------------------------------------------------------------------------
Decimal Decimal::parse(std::string_view text) {
  if (text.empty()) {
    throw std::invalid_argument("Decimal::parse: empty string");
  }

  std::size_t pos = 0;
  bool negative = false;
  if (text[pos] == '+' || text[pos] == '-') {
    negative = text[pos] == '-';
    ++pos;
  }

  Wide integer_part = 0;
  Wide fraction_part = 0;
  int fraction_digits = 0;
  bool seen_digit = false;
  bool seen_point = false;

  for (; pos < text.size(); ++pos) {
    char c = text[pos];
    if (c == '.') {
      if (seen_point) {
        throw std::invalid_argument("Decimal::parse: multiple '.' in '" +
                                    std::string(text) + "'");
      }
      seen_point = true;
      continue;
    }
    if (c < '0' || c > '9') {
      throw std::invalid_argument("Decimal::parse: invalid character in '" +
                                  std::string(text) + "'");
    }
    seen_digit = true;
    int digit = c - '0';
    if (seen_point) {
      if (++fraction_digits > kScale) {
        throw std::invalid_argument("Decimal::parse: more than 8 decimals in '" +
                                    std::string(text) + "'");
      }
      fraction_part = fraction_part * 10 + digit;
    } else {
      integer_part = integer_part * 10 + digit;
      if (integer_part > kMaxRaw / kUnit + 1) {
        throw std::overflow_error("Decimal::parse: out of range '" +
                                  std::string(text) + "'");
      }
    }
  }

  if (!seen_digit) {
    throw std::invalid_argument("Decimal::parse: no digits in '" +
                                std::string(text) + "'");
  }

  for (int i = fraction_digits; i < kScale; ++i) {
    fraction_part *= 10;
  }

  Wide raw = integer_part * kUnit + fraction_part;
  return fromRaw(narrow(negative ? -raw : raw));
}

Decimal Decimal::fromDouble(double value) {
  if (!std::isfinite(value)) {
    throw std::invalid_argument("Decimal::fromDouble: non-finite value");
  }
  double scaled = std::round(value * static_cast<double>(kUnit));
  if (scaled >= 9.2e18 || scaled <= -9.2e18) {
    throw std::overflow_error("Decimal::fromDouble: out of range");
  }
  return fromRaw(static_cast<std::int64_t>(scaled));
}

double Decimal::toDouble() const {
  return static_cast<double>(raw_) / static_cast<double>(kUnit);
}

std::string Decimal::toString() const {
  Wide value = raw_;
  bool negative = value < 0;
  if (negative) {
    value = -value;
  }

  auto integer_part = static_cast<unsigned long long>(value / kUnit);
  auto fraction_part = static_cast<unsigned long long>(value % kUnit);

  std::string out = negative ? "-" : "";
  out += std::to_string(integer_part);

  if (fraction_part != 0) {
    std::string digits = std::to_string(fraction_part);
    digits.insert(0, kScale - digits.size(), '0');
    while (!digits.empty() && digits.back() == '0') {
      digits.pop_back();
    }
    out += '.';
    out += digits;
  }
  return out;
}

Decimal Decimal::abs() const { return raw_ < 0 ? -*this : *this; }

Decimal Decimal::operator+(Decimal other) const {
  return fromRaw(narrow(static_cast<Wide>(raw_) + other.raw_));
}

Decimal Decimal::operator-(Decimal other) const {
  return fromRaw(narrow(static_cast<Wide>(raw_) - other.raw_));
}

Decimal Decimal::operator*(Decimal other) const {
  Wide product = static_cast<Wide>(raw_) * other.raw_;
  return fromRaw(narrow(roundedDivide(product, kUnit)));
}

Decimal Decimal::operator/(Decimal other) const {
  if (other.raw_ == 0) {
    throw std::domain_error("Decimal division by zero");
  }
  Wide numerator = static_cast<Wide>(raw_) * kUnit;
  return fromRaw(narrow(roundedDivide(numerator, other.raw_)));
}

Decimal Decimal::operator-() const {
  return fromRaw(narrow(-static_cast<Wide>(raw_)));
}

std::ostream& operator<<(std::ostream& os, Decimal value) {
  return os << value.toString();
}

}  // namespace domain
}  // namespace tradeguard
