// =============================================================================
// decimal_test.cpp
// =============================================================================
// Unit tests for sigcore::domain::Decimal.
//
// Validates:
//   - Parsing of plain, signed, fractional and exponent forms
//   - Canonical text keeps the scale it was parsed with
//   - Numeric comparison across different scales
//   - Exactness for values wider than 64 bits
//   - Rejection of malformed text and out-of-range values
// =============================================================================

#include "sigcore/domain/decimal.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

using sigcore::domain::Decimal;

// -----------------------------------------------------------------------------
// 1. Plain values keep their digits, including trailing zeros.
// -----------------------------------------------------------------------------
TEST(DecimalTest, ParsePreservesScale) {
  Decimal ten = Decimal::parse("10.0");
  EXPECT_EQ(ten.unscaled(), 100);
  EXPECT_EQ(ten.scale(), 1);
  EXPECT_EQ(ten.toString(), "10.0");

  EXPECT_EQ(Decimal::parse("10").toString(), "10");
  EXPECT_EQ(Decimal::parse("2000.00").toString(), "2000.00");
  EXPECT_EQ(Decimal::parse("1.5").toString(), "1.5");
}

// -----------------------------------------------------------------------------
// 2. Values below one and negative values render with a leading zero.
// -----------------------------------------------------------------------------
TEST(DecimalTest, SmallAndNegativeValues) {
  EXPECT_EQ(Decimal::parse("0.05").toString(), "0.05");
  EXPECT_EQ(Decimal::parse("-0.05").toString(), "-0.05");
  EXPECT_EQ(Decimal::parse("-12.340").toString(), "-12.340");
  EXPECT_EQ(Decimal::parse("+7").toString(), "7");
  EXPECT_EQ(Decimal::parse(".5").toString(), "0.5");
  EXPECT_EQ(Decimal::parse("5.").toString(), "5");
  EXPECT_TRUE(Decimal::parse("-0.05").isNegative());
}

// -----------------------------------------------------------------------------
// 3. Exponent notation is folded into coefficient and scale.
// -----------------------------------------------------------------------------
TEST(DecimalTest, ExponentForms) {
  EXPECT_EQ(Decimal::parse("1.5e3").toString(), "1500");
  EXPECT_EQ(Decimal::parse("25E-2").toString(), "0.25");
  EXPECT_EQ(Decimal::parse("1e+2").toString(), "100");
  EXPECT_EQ(Decimal::parse("1.0e-1").toString(), "0.10");
}

// -----------------------------------------------------------------------------
// 4. Surrounding whitespace is tolerated.
// -----------------------------------------------------------------------------
TEST(DecimalTest, TrimsWhitespace) {
  EXPECT_EQ(Decimal::parse("  42.5\n").toString(), "42.5");
}

// -----------------------------------------------------------------------------
// 5. Equality is numeric: differing scales still compare equal.
// -----------------------------------------------------------------------------
TEST(DecimalTest, NumericComparisonAcrossScales) {
  EXPECT_EQ(Decimal::parse("10.0"), Decimal::parse("10"));
  EXPECT_EQ(Decimal::parse("0.50"), Decimal::parse("0.5"));
  EXPECT_LT(Decimal::parse("99.99"), Decimal::parse("100"));
  EXPECT_GT(Decimal::parse("100.01"), Decimal::parse("100"));
  EXPECT_LT(Decimal::parse("-0.5"), Decimal::parse("0.25"));
  EXPECT_LT(Decimal::parse("-1.5"), Decimal::parse("-1.25"));
  EXPECT_GT(Decimal::parse("0.000000000000000001"), Decimal{});
  EXPECT_NE(Decimal::parse("1.1"), Decimal::parse("1.10000000001"));
}

// -----------------------------------------------------------------------------
// 6. Exactness: 0.1 + 0.2 style values are held exactly.
// -----------------------------------------------------------------------------
TEST(DecimalTest, NoBinaryRounding) {
  Decimal d = Decimal::parse("0.1");
  EXPECT_EQ(d.unscaled(), 1);
  EXPECT_EQ(d.scale(), 1);
  EXPECT_EQ(Decimal::parse("123456789.123456789").toString(),
            "123456789.123456789");
}

// -----------------------------------------------------------------------------
// 7. Malformed input throws std::invalid_argument.
// -----------------------------------------------------------------------------
TEST(DecimalTest, RejectsMalformedText) {
  EXPECT_THROW(Decimal::parse(""), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("   "), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("not-a-number"), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("1.2.3"), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("1e"), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("-"), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("."), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("NaN"), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("Infinity"), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("1,5"), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 8. Values wider than 64 bits stay exact.
// -----------------------------------------------------------------------------
TEST(DecimalTest, WideValuesAreExact) {
  Decimal wei = Decimal::parse("1.000000000000000001");
  EXPECT_EQ(wei.scale(), 18);
  EXPECT_EQ(wei.toString(), "1.000000000000000001");
  EXPECT_GT(wei, Decimal::parse("1"));

  EXPECT_EQ(Decimal::parse("1234.123456789012345678").toString(),
            "1234.123456789012345678");
  EXPECT_EQ(Decimal::parse("12345678901234567890").toString(),
            "12345678901234567890");
  EXPECT_EQ(Decimal::parse("0.0000000000000000001").toString(),
            "0.0000000000000000001");
  EXPECT_EQ(Decimal::parse("-98765432109876543210.5").toString(),
            "-98765432109876543210.5");
  EXPECT_EQ(Decimal::parse("1e30").toString(),
            "1000000000000000000000000000000");

  EXPECT_EQ(Decimal::parse("12345678901234567890.0"),
            Decimal::parse("12345678901234567890"));
  EXPECT_LT(Decimal::parse("12345678901234567889.999999999999999999"),
            Decimal::parse("12345678901234567890"));
  EXPECT_NE(Decimal::parse("0.1000000000000000000001"),
            Decimal::parse("0.1"));

  Decimal::Coefficient big("123456789012345678901234567890");
  EXPECT_EQ(Decimal(big, 10).toString(), "12345678901234567890.1234567890");
}

// -----------------------------------------------------------------------------
// 9. Values beyond the digit or scale limits throw std::out_of_range.
// -----------------------------------------------------------------------------
TEST(DecimalTest, RejectsOutOfRange) {
  EXPECT_THROW(Decimal::parse("1e5000"), std::out_of_range);
  EXPECT_THROW(Decimal::parse("1e-5000"), std::out_of_range);
  EXPECT_THROW(Decimal::parse("1" + std::string(1000, '0')),
               std::out_of_range);
  EXPECT_THROW(Decimal(1, Decimal::kMaxScale + 1), std::out_of_range);
  EXPECT_THROW(Decimal(1, -1), std::out_of_range);
}

// -----------------------------------------------------------------------------
// 10. Streaming uses the canonical text.
// -----------------------------------------------------------------------------
TEST(DecimalTest, StreamOutput) {
  std::ostringstream os;
  os << Decimal(-5, 2);
  EXPECT_EQ(os.str(), "-0.05");
  EXPECT_DOUBLE_EQ(Decimal(15, 1).toDouble(), 1.5);
}
