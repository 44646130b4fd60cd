#include "sigcore/domain/signal_enums.hpp"

#include <cstddef>
#include <utility>

namespace sigcore {
namespace domain {

namespace {

// Tag tables. One row per enumerator; lookups are linear because the sets
// are tiny and fixed.
constexpr std::pair<TradeType, const char*> kTradeTypes[] = {
    {TradeType::Perp, "PERP"},
    {TradeType::Spot, "SPOT"},
    {TradeType::Evm, "EVM"},
};

constexpr std::pair<SignalType, const char*> kSignalTypes[] = {
    {SignalType::Trade, "TRADE"},
};

constexpr std::pair<Side, const char*> kSides[] = {
    {Side::Buy, "BUY"},
    {Side::Sell, "SELL"},
};

constexpr std::pair<OrderType, const char*> kOrderTypes[] = {
    {OrderType::Market, "MARKET"},
    {OrderType::Limit, "LIMIT"},
    {OrderType::StopLoss, "STOP_LOSS"},
    {OrderType::TakeProfit, "TAKE_PROFIT"},
};

template <typename E, std::size_t N>
const char* tagOf(const std::pair<E, const char*> (&table)[N], E value) {
  for (const auto& row : table) {
    if (row.first == value) {
      return row.second;
    }
  }
  return "UNKNOWN";
}

template <typename E, std::size_t N>
std::optional<E> valueOf(const std::pair<E, const char*> (&table)[N],
                         std::string_view tag) {
  for (const auto& row : table) {
    if (tag == row.second) {
      return row.first;
    }
  }
  return std::nullopt;
}

}  // namespace

const char* toString(TradeType v) { return tagOf(kTradeTypes, v); }
const char* toString(SignalType v) { return tagOf(kSignalTypes, v); }
const char* toString(Side v) { return tagOf(kSides, v); }
const char* toString(OrderType v) { return tagOf(kOrderTypes, v); }

std::optional<TradeType> parseTradeType(std::string_view tag) {
  return valueOf(kTradeTypes, tag);
}

std::optional<SignalType> parseSignalType(std::string_view tag) {
  return valueOf(kSignalTypes, tag);
}

std::optional<Side> parseSide(std::string_view tag) {
  return valueOf(kSides, tag);
}

std::optional<OrderType> parseOrderType(std::string_view tag) {
  return valueOf(kOrderTypes, tag);
}

}  // namespace domain
}  // namespace sigcore
