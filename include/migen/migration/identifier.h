#pragma once

#include "migen/core/clock.h"
#include "migen/migration/migration_name.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace migen::migration {

inline constexpr std::size_t kIdentifierLength = 14;

// IdentifierGenerator produces migration identifiers from an injected clock.
//
// Contract:
// - generate(override) returns the override unchanged when present.
// - Otherwise the clock's current instant is formatted as UTC YYYYMMDDHHMMSS.
// - Two calls within the same clock second return equal identifiers; callers that
//   need strict uniqueness must pass distinct overrides.
class IdentifierGenerator {
 public:
  explicit IdentifierGenerator(core::IClock& clock) : clock_(clock) {}

  [[nodiscard]] MigrationIdentifier generate(
      const std::optional<std::string>& override_value = std::nullopt) const;

 private:
  core::IClock& clock_;
};

// is_canonical_identifier reports whether value is exactly kIdentifierLength ASCII digits.
[[nodiscard]] bool is_canonical_identifier(std::string_view value);

}  // namespace migen::migration
