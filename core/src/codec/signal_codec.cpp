#include "sigcore/codec/signal_codec.hpp"
#include "sigcore/domain/signal_error.hpp"
#include "sigcore/time/time_utils.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>

namespace sigcore {

using domain::Decimal;
using domain::SignalFields;
using domain::TradingSignal;

namespace {

// Every key a signal may carry, in record declaration order.
constexpr const char* kFieldNames[] = {
    "signal_id",   "timestamp",         "type",
    "trade_type",  "symbol",            "side",
    "order_type",  "amount_capital_percent",
    "fixed_size",  "leverage",          "limit_price",
    "stop_price",  "take_profit_price", "slippage",
    "network",     "contract_address",  "dex_id",
    "reduce_only", "message",           "source",
    "strategy_name", "timeframe",       "exchange",
};

bool isKnownField(const std::string& key) {
  return std::any_of(std::begin(kFieldNames), std::end(kFieldNames),
                     [&key](const char* name) { return key == name; });
}

// Returns nullptr when the key is absent or explicitly null.
const Json* lookup(const Json& object, const char* field) {
  auto it = object.find(field);
  if (it == object.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

// Text of a JSON value for error reporting: strings unquoted, others dumped.
std::string textOf(const Json& value) {
  return value.is_string() ? value.get<std::string>() : value.dump();
}

// -----------------------------------------------------------------------------
// Encoding helpers
// -----------------------------------------------------------------------------
void putOptional(Json& out, const char* field,
                 const std::optional<Decimal>& value) {
  if (value.has_value()) {
    out[field] = value->toString();
  }
}

void putOptional(Json& out, const char* field,
                 const std::optional<std::string>& value) {
  if (value.has_value()) {
    out[field] = *value;
  }
}

// -----------------------------------------------------------------------------
// Decoding helpers
// -----------------------------------------------------------------------------
template <typename E, typename Parser>
std::optional<E> decodeEnum(const Json& object, const char* field,
                            Parser parse) {
  const Json* value = lookup(object, field);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!value->is_string()) {
    throw SignalError(SignalErrorKind::UnknownEnumValue, field,
                      value->dump());
  }
  const std::string tag = value->get<std::string>();
  std::optional<E> parsed = parse(tag);
  if (!parsed.has_value()) {
    throw SignalError(SignalErrorKind::UnknownEnumValue, field, tag);
  }
  return parsed;
}

std::optional<Decimal> decodeDecimal(const Json& object, const char* field) {
  const Json* value = lookup(object, field);
  if (value == nullptr) {
    return std::nullopt;
  }

  std::string text;
  if (value->is_string()) {
    text = value->get<std::string>();
  } else if (value->is_number()) {
    // Integers dump exactly; floats dump as their shortest round-trip text,
    // so 2000.5 arrives as "2000.5" rather than its binary expansion.
    text = value->dump();
  } else {
    throw SignalError(SignalErrorKind::InvalidDecimal, field, value->dump());
  }

  try {
    return Decimal::parse(text);
  } catch (const std::logic_error& e) {
    throw SignalError(SignalErrorKind::InvalidDecimal, field, text, e.what());
  }
}

std::optional<std::string> decodeText(const Json& object, const char* field) {
  const Json* value = lookup(object, field);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!value->is_string()) {
    throw SignalError(SignalErrorKind::MalformedInterchange, field,
                      value->dump(), "expected a JSON string");
  }
  return value->get<std::string>();
}

template <typename T>
T require(std::optional<T> value, const char* field) {
  if (!value.has_value()) {
    throw SignalError(SignalErrorKind::MissingRequiredField, field, {});
  }
  return std::move(*value);
}

Timestamp decodeTimestamp(const Json& object) {
  static constexpr const char* kField = "timestamp";
  const Json* value = lookup(object, kField);
  if (value == nullptr) {
    throw SignalError(SignalErrorKind::MissingRequiredField, kField, {});
  }
  if (!value->is_string()) {
    throw SignalError(SignalErrorKind::InvalidTimestamp, kField,
                      value->dump(), "expected an ISO-8601 string");
  }
  const std::string text = value->get<std::string>();
  std::optional<Timestamp> ts = parseIso8601(text);
  if (!ts.has_value()) {
    throw SignalError(SignalErrorKind::InvalidTimestamp, kField, text);
  }
  return *ts;
}

bool decodeReduceOnly(const Json& object) {
  static constexpr const char* kField = "reduce_only";
  const Json* value = lookup(object, kField);
  if (value == nullptr) {
    return false;
  }
  if (!value->is_boolean()) {
    throw SignalError(SignalErrorKind::MalformedInterchange, kField,
                      value->dump(), "expected a JSON boolean");
  }
  return value->get<bool>();
}

}  // namespace

// -----------------------------------------------------------------------------
// encode(): sparse object in declaration order
// -----------------------------------------------------------------------------
Json SignalCodec::encode(const TradingSignal& signal) {
  const SignalFields& f = signal.fields();

  Json out = Json::object();
  out["signal_id"] = f.signal_id;
  out["timestamp"] = formatIso8601(f.timestamp);
  out["type"] = domain::toString(f.type);
  out["trade_type"] = domain::toString(f.trade_type);
  out["symbol"] = f.symbol;
  out["side"] = domain::toString(f.side);
  out["order_type"] = domain::toString(f.order_type);

  out["amount_capital_percent"] = f.amount_capital_percent.toString();
  putOptional(out, "fixed_size", f.fixed_size);
  putOptional(out, "leverage", f.leverage);

  putOptional(out, "limit_price", f.limit_price);
  putOptional(out, "stop_price", f.stop_price);
  putOptional(out, "take_profit_price", f.take_profit_price);
  putOptional(out, "slippage", f.slippage);

  putOptional(out, "network", f.network);
  putOptional(out, "contract_address", f.contract_address);
  putOptional(out, "dex_id", f.dex_id);

  out["reduce_only"] = f.reduce_only;

  out["message"] = f.message;
  putOptional(out, "source", f.source);
  putOptional(out, "strategy_name", f.strategy_name);
  putOptional(out, "timeframe", f.timeframe);
  putOptional(out, "exchange", f.exchange);

  return out;
}

// -----------------------------------------------------------------------------
// encodeString(): compact dump, strict UTF-8
// -----------------------------------------------------------------------------
std::string SignalCodec::encodeString(const TradingSignal& signal) {
  try {
    return encode(signal).dump();
  } catch (const Json::type_error& e) {
    throw SignalError(SignalErrorKind::MalformedInterchange, {}, {}, e.what());
  }
}

// -----------------------------------------------------------------------------
// decode(): field-level conversion, then the shared constructor path
// -----------------------------------------------------------------------------
TradingSignal SignalCodec::decode(const Json& object) {
  if (!object.is_object()) {
    throw SignalError(SignalErrorKind::MalformedInterchange, {}, {},
                      "top-level value is not a JSON object");
  }

  for (auto it = object.begin(); it != object.end(); ++it) {
    if (!isKnownField(it.key())) {
      throw SignalError(SignalErrorKind::UnknownField, it.key(),
                        textOf(it.value()));
    }
  }

  // Enum and decimal conversion runs before the presence checks so that a
  // bad tag or number is reported even when other fields are missing.
  auto type = decodeEnum<domain::SignalType>(object, "type",
                                             domain::parseSignalType);
  auto trade_type = decodeEnum<domain::TradeType>(object, "trade_type",
                                                  domain::parseTradeType);
  auto side = decodeEnum<domain::Side>(object, "side", domain::parseSide);
  auto order_type = decodeEnum<domain::OrderType>(object, "order_type",
                                                  domain::parseOrderType);

  auto amount_capital_percent =
      decodeDecimal(object, "amount_capital_percent");

  SignalFields f;
  f.fixed_size = decodeDecimal(object, "fixed_size");
  f.leverage = decodeDecimal(object, "leverage");
  f.limit_price = decodeDecimal(object, "limit_price");
  f.stop_price = decodeDecimal(object, "stop_price");
  f.take_profit_price = decodeDecimal(object, "take_profit_price");
  f.slippage = decodeDecimal(object, "slippage");

  f.signal_id = require(decodeText(object, "signal_id"), "signal_id");
  f.timestamp = decodeTimestamp(object);
  f.type = require(type, "type");
  f.trade_type = require(trade_type, "trade_type");
  f.symbol = require(decodeText(object, "symbol"), "symbol");
  f.side = require(side, "side");
  f.order_type = require(order_type, "order_type");
  f.amount_capital_percent =
      require(amount_capital_percent, "amount_capital_percent");
  f.message = require(decodeText(object, "message"), "message");

  f.network = decodeText(object, "network");
  f.contract_address = decodeText(object, "contract_address");
  f.dex_id = decodeText(object, "dex_id");

  f.reduce_only = decodeReduceOnly(object);

  f.source = decodeText(object, "source");
  f.strategy_name = decodeText(object, "strategy_name");
  f.timeframe = decodeText(object, "timeframe");
  f.exchange = decodeText(object, "exchange");

  return TradingSignal(std::move(f));
}

// -----------------------------------------------------------------------------
// decodeString(): parse JSON text, translate parser errors
// -----------------------------------------------------------------------------
TradingSignal SignalCodec::decodeString(std::string_view text) {
  Json object;
  try {
    object = Json::parse(text.begin(), text.end());
  } catch (const Json::parse_error& e) {
    throw SignalError(SignalErrorKind::MalformedInterchange, {}, {}, e.what());
  }
  return decode(object);
}

}  // namespace sigcore
