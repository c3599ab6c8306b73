#include "migen/migration/identifier.h"

#include "migen/core/normalization.h"
#include "migen/core/time.h"

#include <algorithm>

namespace migen::migration {

MigrationIdentifier IdentifierGenerator::generate(
    const std::optional<std::string>& override_value) const {
  if (override_value.has_value()) {
    return MigrationIdentifier{override_value.value()};
  }
  return MigrationIdentifier{core::format_compact_utc(clock_.now())};
}

bool is_canonical_identifier(const std::string_view value) {
  return value.size() == kIdentifierLength &&
         std::all_of(value.begin(), value.end(), core::is_ascii_digit);
}

}  // namespace migen::migration
