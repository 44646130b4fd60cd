#pragma once

#include "sigcore/domain/decimal.hpp"
#include "sigcore/domain/signal_enums.hpp"
#include "sigcore/time/time_utils.hpp"

#include <optional>
#include <string>
#include <variant>

namespace sigcore {
namespace domain {

// -----------------------------------------------------------------------------
// SignalFields
// -----------------------------------------------------------------------------
// Responsibility: Plain, unvalidated field bag for building a TradingSignal.
//
// @details
// Producers fill one of these, then hand it to the TradingSignal constructor,
// which validates it. Optional members left as std::nullopt mean "not
// supplied" and are omitted from the interchange form.
//
// Defaults describe a market BUY perp trade of zero percent, which fails
// validation until amount_capital_percent is set.
// -----------------------------------------------------------------------------
struct SignalFields {
  // Core
  std::string signal_id;                     // Opaque id (usually a UUID)
  Timestamp timestamp{};                     // UTC emission time
  SignalType type{SignalType::Trade};
  TradeType trade_type{TradeType::Perp};
  std::string symbol;                        // e.g. "ETH-USDT"
  Side side{Side::Buy};
  OrderType order_type{OrderType::Market};

  // Sizing
  Decimal amount_capital_percent;            // (0, 100]
  std::optional<Decimal> fixed_size;
  std::optional<Decimal> leverage;

  // Pricing
  std::optional<Decimal> limit_price;        // required for LIMIT
  std::optional<Decimal> stop_price;         // required for STOP_LOSS
  std::optional<Decimal> take_profit_price;  // required for TAKE_PROFIT
  std::optional<Decimal> slippage;

  // EVM specific
  std::optional<std::string> network;
  std::optional<std::string> contract_address;  // required for EVM
  std::optional<std::string> dex_id;

  // Position management
  bool reduce_only{false};

  // Metadata
  std::string message;                       // Free text, required
  std::optional<std::string> source;
  std::optional<std::string> strategy_name;
  std::optional<std::string> timeframe;
  std::optional<std::string> exchange;
};

bool operator==(const SignalFields& a, const SignalFields& b);
inline bool operator!=(const SignalFields& a, const SignalFields& b) {
  return !(a == b);
}

// -----------------------------------------------------------------------------
// Order instruction variants
// -----------------------------------------------------------------------------
// A validated signal's order type together with the price it requires. An
// execution component can std::visit this instead of re-checking optionals.
// -----------------------------------------------------------------------------
struct MarketOrder {};

struct LimitOrder {
  Decimal limit_price;
};

struct StopLossOrder {
  Decimal stop_price;
};

struct TakeProfitOrder {
  Decimal take_profit_price;
};

using OrderInstruction =
    std::variant<MarketOrder, LimitOrder, StopLossOrder, TakeProfitOrder>;

// -----------------------------------------------------------------------------
// TradingSignal
// -----------------------------------------------------------------------------
//
// @brief  Immutable, validated instruction describing a trade to execute.
//
// @details
// The constructor checks, in order:
//   1. 0 < amount_capital_percent <= 100          → InvalidPercent
//   2. EVM trades carry a non-empty contract_address
//   3. LIMIT orders carry limit_price
//   4. STOP_LOSS orders carry stop_price
//   5. TAKE_PROFIT orders carry take_profit_price
// Checks 2-5 fail with MissingRequiredField naming the missing field. The
// first violation throws SignalError; there is never a partially valid
// TradingSignal.
//
// The timestamp is stored floored to whole microseconds, the finest
// resolution the interchange form carries.
//
// There is no mutation API. To change a signal, copy fields(), edit the copy
// and construct a new TradingSignal from it.
//
// Thread model:
//   Value type with no shared state. Copies may be handed across threads
//   freely.
// -----------------------------------------------------------------------------
class TradingSignal {
 public:
  // @throws SignalError on the first violated invariant.
  explicit TradingSignal(SignalFields fields);

  const SignalFields& fields() const { return fields_; }

  const std::string& signalId() const { return fields_.signal_id; }
  Timestamp timestamp() const { return fields_.timestamp; }
  SignalType type() const { return fields_.type; }
  TradeType tradeType() const { return fields_.trade_type; }
  const std::string& symbol() const { return fields_.symbol; }
  Side side() const { return fields_.side; }
  OrderType orderType() const { return fields_.order_type; }

  const Decimal& amountCapitalPercent() const {
    return fields_.amount_capital_percent;
  }
  const std::optional<Decimal>& fixedSize() const { return fields_.fixed_size; }
  const std::optional<Decimal>& leverage() const { return fields_.leverage; }

  const std::optional<Decimal>& limitPrice() const {
    return fields_.limit_price;
  }
  const std::optional<Decimal>& stopPrice() const { return fields_.stop_price; }
  const std::optional<Decimal>& takeProfitPrice() const {
    return fields_.take_profit_price;
  }
  const std::optional<Decimal>& slippage() const { return fields_.slippage; }

  const std::optional<std::string>& network() const { return fields_.network; }
  const std::optional<std::string>& contractAddress() const {
    return fields_.contract_address;
  }
  const std::optional<std::string>& dexId() const { return fields_.dex_id; }

  bool reduceOnly() const { return fields_.reduce_only; }

  const std::string& message() const { return fields_.message; }
  const std::optional<std::string>& source() const { return fields_.source; }
  const std::optional<std::string>& strategyName() const {
    return fields_.strategy_name;
  }
  const std::optional<std::string>& timeframe() const {
    return fields_.timeframe;
  }
  const std::optional<std::string>& exchange() const {
    return fields_.exchange;
  }

  // Order type paired with its required price. Never fails on a constructed
  // signal because the constructor already enforced the pairing.
  OrderInstruction instruction() const;

  friend bool operator==(const TradingSignal& a, const TradingSignal& b) {
    return a.fields_ == b.fields_;
  }
  friend bool operator!=(const TradingSignal& a, const TradingSignal& b) {
    return !(a == b);
  }

 private:
  void validate() const;

  SignalFields fields_;
};

}  // namespace domain
}  // namespace sigcore
