#include "sigcore/domain/signal_error.hpp"

#include <utility>

namespace sigcore {

namespace {

std::string formatMessage(SignalErrorKind kind, const std::string& field,
                          const std::string& value,
                          const std::string& detail) {
  std::string msg = toString(kind);
  if (!field.empty()) {
    msg += ": ";
    msg += field;
    if (!value.empty()) {
      msg += "='" + value + "'";
    }
  } else if (!value.empty()) {
    msg += ": '" + value + "'";
  }
  if (!detail.empty()) {
    msg += field.empty() && value.empty() ? ": " : " ";
    msg += "(" + detail + ")";
  }
  return msg;
}

}  // namespace

const char* toString(SignalErrorKind kind) {
  using K = SignalErrorKind;
  switch (kind) {
    case K::InvalidPercent:       return "InvalidPercent";
    case K::MissingRequiredField: return "MissingRequiredField";
    case K::UnknownEnumValue:     return "UnknownEnumValue";
    case K::InvalidDecimal:       return "InvalidDecimal";
    case K::MalformedInterchange: return "MalformedInterchange";
    case K::InvalidTimestamp:     return "InvalidTimestamp";
    case K::UnknownField:         return "UnknownField";
  }
  return "Unknown";
}

SignalError::SignalError(SignalErrorKind kind, std::string field,
                         std::string value, const std::string& detail)
    : std::runtime_error(formatMessage(kind, field, value, detail)),
      kind_(kind),
      field_(std::move(field)),
      value_(std::move(value)) {}

}  // namespace sigcore
