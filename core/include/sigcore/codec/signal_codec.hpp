#pragma once

#include "sigcore/domain/trading_signal.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace sigcore {

// Interchange object type. ordered_json keeps keys in record declaration
// order so the wire text reads the same way the record is laid out.
using Json = nlohmann::ordered_json;

// -----------------------------------------------------------------------------
// SignalCodec: TradingSignal <-> interchange object <-> JSON text
// -----------------------------------------------------------------------------
//
// @brief  The single gatekeeper between raw signal text and validated
//         TradingSignal values.
//
// @details
// Interchange object shape (absent optionals are omitted, not null):
//   {
//     "signal_id":              "123e4567-e89b-12d3-a456-426614174000",
//     "timestamp":              "2024-02-19T12:00:00Z",
//     "type":                   "TRADE",
//     "trade_type":             "PERP",
//     "symbol":                 "ETH-USDT",
//     "side":                   "BUY",
//     "order_type":             "LIMIT",
//     "amount_capital_percent": "10.0",
//     "limit_price":            "2000.0",
//     "reduce_only":            false,
//     "message":                "ETH breakout trade"
//   }
//
// Encoding rules:
//   - Enums           → wire tag string.
//   - Timestamp       → ISO-8601 with a 'Z' suffix.
//   - Decimal fields  → JSON *string* holding the canonical decimal text.
//                       Always a string, for every decimal field, so no
//                       JSON reader can turn a price into a binary double.
//   - reduce_only     → JSON boolean, always present.
//   - Other strings   → unchanged.
//
// Decoding accepts decimals either as strings or as JSON numbers (floats are
// taken through their shortest round-trip text). Every failure throws
// SignalError; see decode() for the mapping.
//
// Thread model:
//   Stateless. All members are static and reentrant.
// -----------------------------------------------------------------------------
class SignalCodec {
 public:
  // -------------------------------------------------------------------------
  // encode(signal)
  // -------------------------------------------------------------------------
  // @brief  Builds the sparse interchange object for a signal.
  // -------------------------------------------------------------------------
  static Json encode(const domain::TradingSignal& signal);

  // -------------------------------------------------------------------------
  // encodeString(signal)
  // -------------------------------------------------------------------------
  // @brief  encode() followed by a compact dump.
  //
  // @throws SignalError(MalformedInterchange) if a string field is not valid
  //         UTF-8 and therefore cannot be written as JSON.
  // -------------------------------------------------------------------------
  static std::string encodeString(const domain::TradingSignal& signal);

  // -------------------------------------------------------------------------
  // decode(object)
  // -------------------------------------------------------------------------
  // @brief  Converts an interchange object into a validated TradingSignal.
  //
  // @details
  // Steps, each of which may throw SignalError:
  //   1. Top level must be an object               → MalformedInterchange
  //   2. Every key must be a record field          → UnknownField
  //   3. Enum fields: tag in the closed set        → UnknownEnumValue
  //   4. Decimal fields: exact decimal text/number → InvalidDecimal
  //   5. Required fields present and non-null      → MissingRequiredField
  //      String fields hold JSON strings           → MalformedInterchange
  //      timestamp is ISO-8601 text                → InvalidTimestamp
  //   6. TradingSignal constructor invariants      → InvalidPercent /
  //                                                  MissingRequiredField
  // Null values of optional fields mean "not supplied".
  // -------------------------------------------------------------------------
  static domain::TradingSignal decode(const Json& object);

  // -------------------------------------------------------------------------
  // decodeString(text)
  // -------------------------------------------------------------------------
  // @brief  Parses JSON text, then decode().
  //
  // @throws SignalError(MalformedInterchange) if the text is not valid JSON,
  //         plus everything decode() throws.
  // -------------------------------------------------------------------------
  static domain::TradingSignal decodeString(std::string_view text);
};

}  // namespace sigcore
