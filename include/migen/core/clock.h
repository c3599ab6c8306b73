#pragma once

#include "migen/core/time.h"

#include <chrono>

namespace migen::core {

// Abstract clock interface for timestamp injection.
// Production code reads the system clock; tests pin or step a fixed instant.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return the current instant (UTC).
  virtual Timestamp now() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  Timestamp now() override;
};

// Fixed clock: returns a pinned instant until explicitly advanced.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(Timestamp fixed_time) : fixed_time_(fixed_time) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  Timestamp now() override;

  // Simulated clock advance.
  void advance(std::chrono::seconds delta) { fixed_time_ += delta; }

 private:
  Timestamp fixed_time_;
};

}  // namespace migen::core
