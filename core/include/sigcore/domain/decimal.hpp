#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace sigcore {
namespace domain {

// -----------------------------------------------------------------------------
// Decimal: exact base-10 fixed-point number
// -----------------------------------------------------------------------------
//
// @brief  Carries prices, sizes and percentages without binary floating-point
//         rounding.
//
// @details
// Stored as an arbitrary-precision unscaled coefficient plus a scale (the
// number of fractional digits):
//
//   value = unscaled / 10^scale
//
//   "2000.0"  → unscaled 20000, scale 1
//   "1.5"     → unscaled 15,    scale 1
//   "-0.05"   → unscaled -5,    scale 2
//   "1.000000000000000001" → unscaled 1000000000000000001, scale 18
//
// The scale is part of the value's textual identity: "10.0" and "10" compare
// equal but render differently, so a value read from the wire is written back
// with exactly the digits it arrived with.
//
// Limits: at most kMaxDigits coefficient digits and kMaxScale fractional
// digits. These only bound hostile input such as "1e999999"; anything larger
// is rejected at parse time rather than rounded.
//
// Thread model:
//   Plain value type. Safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
class Decimal {
 public:
  using Coefficient = boost::multiprecision::cpp_int;

  static constexpr int kMaxScale = 1000;
  static constexpr int kMaxDigits = 1000;

  // Zero with scale 0.
  Decimal() = default;

  // -------------------------------------------------------------------------
  // Decimal(unscaled, scale)
  // -------------------------------------------------------------------------
  // @brief  Builds unscaled / 10^scale directly.
  //
  // @throws std::out_of_range if scale is outside [0, kMaxScale] or the
  //         coefficient has more than kMaxDigits digits.
  // -------------------------------------------------------------------------
  Decimal(std::int64_t unscaled, int scale);
  Decimal(Coefficient unscaled, int scale);

  // -------------------------------------------------------------------------
  // parse(text)
  // -------------------------------------------------------------------------
  // @brief  Parses decimal text into an exact value.
  //
  // @param  text  Optional surrounding whitespace, optional sign, digits with
  //               an optional '.' fraction (".5" and "5." are accepted), and
  //               an optional exponent ("1.5e3", "25E-2").
  //
  // @details
  // The resulting scale is (fraction digits - exponent). A negative scale is
  // folded into the coefficient, so "1.5e3" yields 1500 with scale 0.
  // NaN and Infinity have no exact representation and are rejected.
  //
  // @throws std::invalid_argument on malformed text.
  // @throws std::out_of_range if the value exceeds the digit or scale limits.
  // -------------------------------------------------------------------------
  static Decimal parse(std::string_view text);

  // Canonical fixed-point text with exactly scale() fractional digits.
  std::string toString() const;

  // Approximate binary value. For display and logging only.
  double toDouble() const;

  const Coefficient& unscaled() const { return unscaled_; }
  int scale() const { return scale_; }

  bool isNegative() const { return unscaled_.sign() < 0; }

  // Three-way numeric comparison across scales: <0, 0, >0.
  int compare(const Decimal& other) const;

  friend bool operator==(const Decimal& a, const Decimal& b) {
    return a.compare(b) == 0;
  }
  friend bool operator!=(const Decimal& a, const Decimal& b) {
    return a.compare(b) != 0;
  }
  friend bool operator<(const Decimal& a, const Decimal& b) {
    return a.compare(b) < 0;
  }
  friend bool operator<=(const Decimal& a, const Decimal& b) {
    return a.compare(b) <= 0;
  }
  friend bool operator>(const Decimal& a, const Decimal& b) {
    return a.compare(b) > 0;
  }
  friend bool operator>=(const Decimal& a, const Decimal& b) {
    return a.compare(b) >= 0;
  }

 private:
  Coefficient unscaled_{0};
  int scale_{0};
};

std::ostream& operator<<(std::ostream& os, const Decimal& d);

}  // namespace domain
}  // namespace sigcore
