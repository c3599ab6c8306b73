#include "migen/core/clock.h"

namespace migen::core {

Timestamp SystemClock::now() {
  return now_utc();
}

Timestamp FixedClock::now() {
  return fixed_time_;
}

}  // namespace migen::core
