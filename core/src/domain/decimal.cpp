#include "sigcore/domain/decimal.hpp"

#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace sigcore {
namespace domain {

namespace {

// Upper bound for |exponent|. Anything beyond cannot produce a value within
// the digit limits, so there is no point accumulating further.
constexpr int kMaxExponentMagnitude = 100000;

Decimal::Coefficient pow10(int exponent) {
  return boost::multiprecision::pow(Decimal::Coefficient(10),
                                    static_cast<unsigned>(exponent));
}

std::string magnitudeDigits(const Decimal::Coefficient& value) {
  const Decimal::Coefficient magnitude = boost::multiprecision::abs(value);
  return magnitude.str();
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }

std::string_view trim(std::string_view text) {
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: range-check coefficient and scale
// -----------------------------------------------------------------------------
Decimal::Decimal(std::int64_t unscaled, int scale)
    : Decimal(Coefficient(unscaled), scale) {}

Decimal::Decimal(Coefficient unscaled, int scale)
    : unscaled_(std::move(unscaled)), scale_(scale) {
  if (scale < 0 || scale > kMaxScale) {
    throw std::out_of_range("Decimal scale out of range: " +
                            std::to_string(scale));
  }
  if (magnitudeDigits(unscaled_).size() >
      static_cast<std::size_t>(kMaxDigits)) {
    throw std::out_of_range("Decimal coefficient exceeds " +
                            std::to_string(kMaxDigits) + " digits");
  }
}

// -----------------------------------------------------------------------------
// parse(): [ws] [+-] digits [. digits] [e [+-] digits] [ws]
// -----------------------------------------------------------------------------
Decimal Decimal::parse(std::string_view text) {
  const std::string original(text);
  text = trim(text);

  std::size_t pos = 0;
  bool negative = false;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    negative = text[pos] == '-';
    ++pos;
  }

  std::string digits;
  int fraction_digits = 0;

  while (pos < text.size() && isDigit(text[pos])) {
    digits.push_back(text[pos++]);
  }
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && isDigit(text[pos])) {
      digits.push_back(text[pos++]);
      ++fraction_digits;
    }
  }
  if (digits.empty()) {
    throw std::invalid_argument("Not a decimal number: '" + original + "'");
  }

  int exponent = 0;
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    bool exp_negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      exp_negative = text[pos] == '-';
      ++pos;
    }
    if (pos >= text.size() || !isDigit(text[pos])) {
      throw std::invalid_argument("Malformed exponent in '" + original + "'");
    }
    while (pos < text.size() && isDigit(text[pos])) {
      if (exponent < kMaxExponentMagnitude) {
        exponent = exponent * 10 + (text[pos] - '0');
      }
      ++pos;
    }
    if (exp_negative) {
      exponent = -exponent;
    }
  }

  if (pos != text.size()) {
    throw std::invalid_argument("Not a decimal number: '" + original + "'");
  }

  // Strip leading zeros; what remains are the significant digits.
  std::size_t first = digits.find_first_not_of('0');
  std::string significant =
      first == std::string::npos ? std::string() : digits.substr(first);

  int scale = fraction_digits - exponent;

  if (significant.empty()) {
    // Zero keeps its scale when it fits ("0.00"), otherwise collapses.
    return Decimal(0, scale < 0 ? 0 : (scale > kMaxScale ? kMaxScale : scale));
  }

  if (scale < 0) {
    if (static_cast<int>(significant.size()) - scale > kMaxDigits) {
      throw std::out_of_range("Decimal too large: '" + original + "'");
    }
    significant.append(static_cast<std::size_t>(-scale), '0');
    scale = 0;
  }
  if (scale > kMaxScale) {
    throw std::out_of_range("Decimal has more than " +
                            std::to_string(kMaxScale) +
                            " fractional digits: '" + original + "'");
  }
  if (static_cast<int>(significant.size()) > kMaxDigits) {
    throw std::out_of_range("Decimal has more than " +
                            std::to_string(kMaxDigits) +
                            " significant digits: '" + original + "'");
  }

  // significant starts with 1-9, so cpp_int never reads it as octal.
  Coefficient unscaled(significant.c_str());
  if (negative) {
    unscaled = -unscaled;
  }
  return Decimal(std::move(unscaled), scale);
}

// -----------------------------------------------------------------------------
// toString(): fixed-point rendering with exactly scale_ fractional digits
// -----------------------------------------------------------------------------
std::string Decimal::toString() const {
  std::string digits = magnitudeDigits(unscaled_);

  if (scale_ > 0) {
    if (static_cast<int>(digits.size()) <= scale_) {
      digits.insert(0, static_cast<std::size_t>(scale_ + 1) - digits.size(),
                    '0');
    }
    digits.insert(digits.size() - static_cast<std::size_t>(scale_), 1, '.');
  }

  return isNegative() ? "-" + digits : digits;
}

double Decimal::toDouble() const {
  return std::strtod(toString().c_str(), nullptr);
}

// -----------------------------------------------------------------------------
// compare(): align both coefficients to the larger scale, then compare
// -----------------------------------------------------------------------------
int Decimal::compare(const Decimal& other) const {
  if (scale_ == other.scale_) {
    return unscaled_ < other.unscaled_ ? -1 : (unscaled_ > other.unscaled_);
  }

  if (scale_ < other.scale_) {
    const Coefficient aligned = unscaled_ * pow10(other.scale_ - scale_);
    return aligned < other.unscaled_ ? -1 : (aligned > other.unscaled_);
  }
  const Coefficient aligned = other.unscaled_ * pow10(scale_ - other.scale_);
  return unscaled_ < aligned ? -1 : (unscaled_ > aligned);
}

std::ostream& operator<<(std::ostream& os, const Decimal& d) {
  return os << d.toString();
}

}  // namespace domain
}  // namespace sigcore
