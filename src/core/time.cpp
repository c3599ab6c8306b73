#include "migen/core/time.h"

#include <iomanip>
#include <sstream>

namespace migen::core {

Timestamp make_utc(int year, unsigned month, unsigned day, int hour, int minute, int second) {
  const std::chrono::sys_days date{std::chrono::year{year} / std::chrono::month{month} /
                                   std::chrono::day{day}};
  return Timestamp{date} + std::chrono::hours{hour} + std::chrono::minutes{minute} +
         std::chrono::seconds{second};
}

std::string format_compact_utc(const Timestamp ts) {
  const auto secs = std::chrono::floor<std::chrono::seconds>(ts);
  const auto day_start = std::chrono::floor<std::chrono::days>(secs);
  const std::chrono::year_month_day ymd{day_start};
  const std::chrono::hh_mm_ss hms{secs - day_start};

  // Explicit widths keep the output fixed-width, so lexicographic order is chronological.
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << std::setw(2) << static_cast<unsigned>(ymd.day())
      << std::setw(2) << hms.hours().count() << std::setw(2) << hms.minutes().count()
      << std::setw(2) << hms.seconds().count();
  return oss.str();
}

}  // namespace migen::core
