#pragma once

#include <chrono>
#include <string>

namespace migen::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline Timestamp now_utc() { return Clock::now(); }

// make_utc builds a UTC instant from calendar fields.
// Fields are not range-checked; out-of-range values follow std::chrono calendar arithmetic.
[[nodiscard]] Timestamp make_utc(int year, unsigned month, unsigned day, int hour = 0,
                                 int minute = 0, int second = 0);

// format_compact_utc renders ts as YYYYMMDDHHMMSS (14 characters, zero-padded, UTC).
// Sub-second precision is truncated.
[[nodiscard]] std::string format_compact_utc(Timestamp ts);

}  // namespace migen::core
