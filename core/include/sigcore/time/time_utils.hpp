#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sigcore {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock point in time, always interpreted as UTC. Signals carry one to
// record when the producer emitted them.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions converting Timestamp to and from epoch milliseconds
//         and ISO-8601 text.
//
// @details
// The millisecond helpers are inline one-liners. The ISO-8601 pair does
// civil-calendar arithmetic and lives in time_utils.cpp.
//
// Thread-safety: Stateless. No calls into gmtime/timegm or the process
// timezone, so these are safe to call from any thread.
// -----------------------------------------------------------------------------

// Epoch milliseconds → Timestamp.
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

// Timestamp → epoch milliseconds (truncated).
inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// formatIso8601
// -------------------------------------------------------------------------
// @brief  Renders a Timestamp as "YYYY-MM-DDTHH:MM:SS[.ffffff]Z".
//
// @details
// The fraction is written with six digits only when the microsecond part is
// non-zero; anything finer than a microsecond is truncated. The trailing 'Z'
// marks the value as UTC.
// -------------------------------------------------------------------------
std::string formatIso8601(Timestamp tp);

// -------------------------------------------------------------------------
// parseIso8601
// -------------------------------------------------------------------------
// @brief  Parses "YYYY-MM-DDTHH:MM:SS[.f{1,9}][Z|+HH:MM|-HH:MM]".
//
// @return The UTC instant, or std::nullopt if the text is not a valid
//         timestamp (bad layout, out-of-range field, trailing garbage) or
//         names an instant outside the range of Timestamp::duration.
//
// @details
// 'T' or a single space separates date and time. A missing zone suffix is
// taken as UTC. A numeric offset is subtracted to normalize to UTC; the
// offset may be written with or without the colon.
// -------------------------------------------------------------------------
std::optional<Timestamp> parseIso8601(std::string_view text);

}  // namespace sigcore
