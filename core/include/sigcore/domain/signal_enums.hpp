#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sigcore {
namespace domain {

// -----------------------------------------------------------------------------
// Signal enumerations: closed tag sets of the interchange format
// -----------------------------------------------------------------------------
//
// @brief  The four categorical fields of a TradingSignal.
//
// @details
// Each enum has a fixed wire tag (the upper-case spelling shown in the
// comments). The tags are part of the interchange contract: producers and
// consumers must match them exactly, including case.
//
// Conversion goes through explicit lookup tables in signal_enums.cpp:
//   toString(value)        → wire tag (never a numeric code)
//   parseXxx(tag)          → std::nullopt for any tag outside the set
//
// Callers that must reject unknown tags (the codec) turn std::nullopt into
// a SignalError with kind UnknownEnumValue.
// -----------------------------------------------------------------------------

enum class TradeType {
  Perp,  // "PERP"
  Spot,  // "SPOT"
  Evm,   // "EVM", on-chain swap, needs contract_address
};

enum class SignalType {
  Trade,  // "TRADE"
};

enum class Side {
  Buy,   // "BUY"
  Sell,  // "SELL"
};

enum class OrderType {
  Market,      // "MARKET"
  Limit,       // "LIMIT", needs limit_price
  StopLoss,    // "STOP_LOSS", needs stop_price
  TakeProfit,  // "TAKE_PROFIT", needs take_profit_price
};

const char* toString(TradeType v);
const char* toString(SignalType v);
const char* toString(Side v);
const char* toString(OrderType v);

std::optional<TradeType> parseTradeType(std::string_view tag);
std::optional<SignalType> parseSignalType(std::string_view tag);
std::optional<Side> parseSide(std::string_view tag);
std::optional<OrderType> parseOrderType(std::string_view tag);

}  // namespace domain
}  // namespace sigcore
