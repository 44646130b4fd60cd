// =============================================================================
// signal_enums_test.cpp
// =============================================================================
// Unit tests for the signal enum tag tables.
//
// Validates:
//   - Every enumerator maps to its wire tag and back
//   - Lookups are exact and case-sensitive
// =============================================================================

#include "sigcore/domain/signal_enums.hpp"

#include <gtest/gtest.h>

#include <string>

namespace d = sigcore::domain;

TEST(SignalEnumsTest, TradeTypeTags) {
  EXPECT_STREQ(d::toString(d::TradeType::Perp), "PERP");
  EXPECT_STREQ(d::toString(d::TradeType::Spot), "SPOT");
  EXPECT_STREQ(d::toString(d::TradeType::Evm), "EVM");

  EXPECT_EQ(d::parseTradeType("PERP"), d::TradeType::Perp);
  EXPECT_EQ(d::parseTradeType("SPOT"), d::TradeType::Spot);
  EXPECT_EQ(d::parseTradeType("EVM"), d::TradeType::Evm);
}

TEST(SignalEnumsTest, SignalTypeTags) {
  EXPECT_STREQ(d::toString(d::SignalType::Trade), "TRADE");
  EXPECT_EQ(d::parseSignalType("TRADE"), d::SignalType::Trade);
  EXPECT_FALSE(d::parseSignalType("ALERT").has_value());
}

TEST(SignalEnumsTest, SideTags) {
  EXPECT_STREQ(d::toString(d::Side::Buy), "BUY");
  EXPECT_STREQ(d::toString(d::Side::Sell), "SELL");
  EXPECT_EQ(d::parseSide("BUY"), d::Side::Buy);
  EXPECT_EQ(d::parseSide("SELL"), d::Side::Sell);
}

TEST(SignalEnumsTest, OrderTypeTagsRoundTrip) {
  for (auto type : {d::OrderType::Market, d::OrderType::Limit,
                    d::OrderType::StopLoss, d::OrderType::TakeProfit}) {
    EXPECT_EQ(d::parseOrderType(d::toString(type)), type);
  }
  EXPECT_STREQ(d::toString(d::OrderType::StopLoss), "STOP_LOSS");
  EXPECT_STREQ(d::toString(d::OrderType::TakeProfit), "TAKE_PROFIT");
}

// -----------------------------------------------------------------------------
// Unknown, mis-cased or padded tags are not in the closed set.
// -----------------------------------------------------------------------------
TEST(SignalEnumsTest, RejectsUnknownTags) {
  EXPECT_FALSE(d::parseOrderType("BOGUS").has_value());
  EXPECT_FALSE(d::parseOrderType("POST_ONLY").has_value());
  EXPECT_FALSE(d::parseSide("buy").has_value());
  EXPECT_FALSE(d::parseSide(" BUY").has_value());
  EXPECT_FALSE(d::parseTradeType("").has_value());
  EXPECT_FALSE(d::parseTradeType("Perp").has_value());
}
