// =============================================================================
// time_utils_test.cpp
// =============================================================================
// Unit tests for the ISO-8601 and epoch-millisecond helpers.
// =============================================================================

#include "sigcore/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>

using sigcore::Timestamp;

namespace {

// 2024-02-19T12:00:00Z
constexpr std::int64_t kSampleMs = 1708344000000LL;

}  // namespace

TEST(TimeUtilsTest, MillisecondConversionsAreInverse) {
  Timestamp ts = sigcore::ms_to_timestamp(kSampleMs);
  EXPECT_EQ(sigcore::timestamp_to_ms(ts), kSampleMs);
}

// -----------------------------------------------------------------------------
// 1. Whole seconds render without a fraction and with a 'Z' suffix.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, FormatWholeSeconds) {
  EXPECT_EQ(sigcore::formatIso8601(sigcore::ms_to_timestamp(kSampleMs)),
            "2024-02-19T12:00:00Z");
  EXPECT_EQ(sigcore::formatIso8601(sigcore::ms_to_timestamp(0)),
            "1970-01-01T00:00:00Z");
}

// -----------------------------------------------------------------------------
// 2. Sub-second values render with six digits.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, FormatFractionalSeconds) {
  Timestamp ts = sigcore::ms_to_timestamp(kSampleMs + 250);
  EXPECT_EQ(sigcore::formatIso8601(ts), "2024-02-19T12:00:00.250000Z");

  ts += std::chrono::microseconds{7};
  EXPECT_EQ(sigcore::formatIso8601(ts), "2024-02-19T12:00:00.250007Z");
}

// -----------------------------------------------------------------------------
// 3. Leap day and pre-epoch instants.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, FormatCalendarEdges) {
  auto leap = sigcore::parseIso8601("2024-02-29T23:59:59Z");
  ASSERT_TRUE(leap.has_value());
  EXPECT_EQ(sigcore::formatIso8601(*leap), "2024-02-29T23:59:59Z");

  EXPECT_EQ(sigcore::formatIso8601(sigcore::ms_to_timestamp(-1000)),
            "1969-12-31T23:59:59Z");
}

// -----------------------------------------------------------------------------
// 4. Parsing accepts 'Z', no suffix, and numeric offsets.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, ParseZoneForms) {
  const Timestamp expected = sigcore::ms_to_timestamp(kSampleMs);

  EXPECT_EQ(sigcore::parseIso8601("2024-02-19T12:00:00Z"), expected);
  EXPECT_EQ(sigcore::parseIso8601("2024-02-19T12:00:00"), expected);
  EXPECT_EQ(sigcore::parseIso8601("2024-02-19 12:00:00Z"), expected);
  EXPECT_EQ(sigcore::parseIso8601("2024-02-19T12:00:00+00:00"), expected);
  EXPECT_EQ(sigcore::parseIso8601("2024-02-19T14:00:00+02:00"), expected);
  EXPECT_EQ(sigcore::parseIso8601("2024-02-19T06:30:00-0530"), expected);
}

TEST(TimeUtilsTest, ParseFraction) {
  auto ts = sigcore::parseIso8601("2024-02-19T12:00:00.123456Z");
  ASSERT_TRUE(ts.has_value());
  EXPECT_EQ(sigcore::formatIso8601(*ts), "2024-02-19T12:00:00.123456Z");

  auto ms = sigcore::parseIso8601("2024-02-19T12:00:00.5Z");
  ASSERT_TRUE(ms.has_value());
  EXPECT_EQ(sigcore::timestamp_to_ms(*ms), kSampleMs + 500);
}

// -----------------------------------------------------------------------------
// 5. Malformed or out-of-range text is rejected.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, ParseRejectsGarbage) {
  EXPECT_FALSE(sigcore::parseIso8601("").has_value());
  EXPECT_FALSE(sigcore::parseIso8601("yesterday").has_value());
  EXPECT_FALSE(sigcore::parseIso8601("2024-02-19").has_value());
  EXPECT_FALSE(sigcore::parseIso8601("2024-13-01T00:00:00Z").has_value());
  EXPECT_FALSE(sigcore::parseIso8601("2023-02-29T00:00:00Z").has_value());
  EXPECT_FALSE(sigcore::parseIso8601("2024-02-19T24:00:00Z").has_value());
  EXPECT_FALSE(sigcore::parseIso8601("2024-02-19T12:00:00.Z").has_value());
  EXPECT_FALSE(sigcore::parseIso8601("2024-02-19T12:00:00ZZ").has_value());
  EXPECT_FALSE(sigcore::parseIso8601("2024-02-19T12:00:00+2").has_value());
}

// -----------------------------------------------------------------------------
// 6. Instants the clock cannot hold are rejected, never wrapped.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, ParseRejectsInstantsOutsideClockRange) {
  const auto max_seconds =
      std::chrono::duration_cast<std::chrono::seconds>(
          Timestamp::duration::max())
          .count();
  // 2300-01-01T00:00:00Z is 10413792000 seconds after the epoch.
  const bool clock_holds_2300 = max_seconds > 10413792000LL;

  for (const char* text : {"2300-01-01T00:00:00Z", "1600-01-01T00:00:00Z",
                           "9999-12-31T23:59:59Z"}) {
    auto ts = sigcore::parseIso8601(text);
    if (clock_holds_2300) {
      ASSERT_TRUE(ts.has_value()) << text;
      EXPECT_EQ(sigcore::formatIso8601(*ts), text);
    } else {
      EXPECT_FALSE(ts.has_value()) << text;
    }
  }

  // Both ends of a nanosecond clock's range are still representable.
  auto early = sigcore::parseIso8601("1700-01-01T00:00:00Z");
  ASSERT_TRUE(early.has_value());
  EXPECT_EQ(sigcore::formatIso8601(*early), "1700-01-01T00:00:00Z");

  auto late = sigcore::parseIso8601("2262-01-01T00:00:00.5Z");
  ASSERT_TRUE(late.has_value());
  EXPECT_EQ(sigcore::formatIso8601(*late), "2262-01-01T00:00:00.500000Z");
}
