#pragma once

#include <stdexcept>
#include <string>

namespace sigcore {

// -----------------------------------------------------------------------------
// SignalErrorKind: classification of every signal validation failure
// -----------------------------------------------------------------------------
//
// @details
// All kinds are local, recoverable failures. A caller holding a SignalError
// decides whether to fix the input, drop the message, or alert someone; the
// library only classifies and reports.
// -----------------------------------------------------------------------------
enum class SignalErrorKind {
  InvalidPercent,        // amount_capital_percent outside (0, 100]
  MissingRequiredField,  // core or conditionally-required field absent
  UnknownEnumValue,      // tag not in the closed set for that field
  InvalidDecimal,        // value cannot be parsed as an exact decimal
  MalformedInterchange,  // not JSON, not an object, or wrong JSON type
  InvalidTimestamp,      // timestamp text is not ISO-8601
  UnknownField,          // key that is not part of the record
};

const char* toString(SignalErrorKind kind);

// -----------------------------------------------------------------------------
// SignalError
// -----------------------------------------------------------------------------
//
// @brief  Exception thrown by TradingSignal construction and by the codec.
//
// @details
// Carries the kind plus the offending field name and textual value so that
// callers can distinguish failures without parsing what(). field() and
// value() are empty when they do not apply (e.g. a JSON syntax error).
//
// what() reads like:
//   "UnknownEnumValue: order_type='BOGUS'"
//   "MissingRequiredField: limit_price (required for LIMIT orders)"
// -----------------------------------------------------------------------------
class SignalError : public std::runtime_error {
 public:
  SignalError(SignalErrorKind kind, std::string field, std::string value,
              const std::string& detail = {});

  SignalErrorKind kind() const noexcept { return kind_; }
  const std::string& field() const noexcept { return field_; }
  const std::string& value() const noexcept { return value_; }

 private:
  SignalErrorKind kind_;
  std::string field_;
  std::string value_;
};

}  // namespace sigcore
