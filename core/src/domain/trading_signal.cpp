#include "sigcore/domain/trading_signal.hpp"
#include "sigcore/domain/signal_error.hpp"

#include <chrono>
#include <utility>

namespace sigcore {
namespace domain {

namespace {

const Decimal kMaxCapitalPercent{100, 0};

// Conditionally-required price check shared by invariants 3-5.
void requirePrice(const std::optional<Decimal>& price, const char* field,
                  OrderType order_type) {
  if (!price.has_value()) {
    throw SignalError(SignalErrorKind::MissingRequiredField, field, {},
                      std::string("required for ") + toString(order_type) +
                          " orders");
  }
}

}  // namespace

bool operator==(const SignalFields& a, const SignalFields& b) {
  return a.signal_id == b.signal_id && a.timestamp == b.timestamp &&
         a.type == b.type && a.trade_type == b.trade_type &&
         a.symbol == b.symbol && a.side == b.side &&
         a.order_type == b.order_type &&
         a.amount_capital_percent == b.amount_capital_percent &&
         a.fixed_size == b.fixed_size && a.leverage == b.leverage &&
         a.limit_price == b.limit_price && a.stop_price == b.stop_price &&
         a.take_profit_price == b.take_profit_price &&
         a.slippage == b.slippage && a.network == b.network &&
         a.contract_address == b.contract_address && a.dex_id == b.dex_id &&
         a.reduce_only == b.reduce_only && a.message == b.message &&
         a.source == b.source && a.strategy_name == b.strategy_name &&
         a.timeframe == b.timeframe && a.exchange == b.exchange;
}

// -----------------------------------------------------------------------------
// Constructor: take ownership of the fields, then validate
// -----------------------------------------------------------------------------
// The interchange form carries microseconds, so the stored timestamp is
// floored to that resolution.
TradingSignal::TradingSignal(SignalFields fields) : fields_(std::move(fields)) {
  fields_.timestamp =
      std::chrono::floor<std::chrono::microseconds>(fields_.timestamp);
  validate();
}

// -----------------------------------------------------------------------------
// validate(): invariants 1-5, first violation wins
// -----------------------------------------------------------------------------
void TradingSignal::validate() const {
  const Decimal& pct = fields_.amount_capital_percent;
  if (pct <= Decimal{} || pct > kMaxCapitalPercent) {
    throw SignalError(SignalErrorKind::InvalidPercent,
                      "amount_capital_percent", pct.toString(),
                      "must be in (0, 100]");
  }

  if (fields_.trade_type == TradeType::Evm &&
      (!fields_.contract_address.has_value() ||
       fields_.contract_address->empty())) {
    throw SignalError(SignalErrorKind::MissingRequiredField,
                      "contract_address", {}, "required for EVM trades");
  }

  switch (fields_.order_type) {
    case OrderType::Limit:
      requirePrice(fields_.limit_price, "limit_price", fields_.order_type);
      break;
    case OrderType::StopLoss:
      requirePrice(fields_.stop_price, "stop_price", fields_.order_type);
      break;
    case OrderType::TakeProfit:
      requirePrice(fields_.take_profit_price, "take_profit_price",
                   fields_.order_type);
      break;
    case OrderType::Market:
      break;
  }
}

// -----------------------------------------------------------------------------
// instruction(): order type plus its companion price
// -----------------------------------------------------------------------------
OrderInstruction TradingSignal::instruction() const {
  switch (fields_.order_type) {
    case OrderType::Limit:
      return LimitOrder{*fields_.limit_price};
    case OrderType::StopLoss:
      return StopLossOrder{*fields_.stop_price};
    case OrderType::TakeProfit:
      return TakeProfitOrder{*fields_.take_profit_price};
    case OrderType::Market:
      break;
  }
  return MarketOrder{};
}

}  // namespace domain
}  // namespace sigcore
