#pragma once

#include "migen/migration/migration_name.h"

#include <filesystem>
#include <string>

namespace migen::migration {

inline constexpr const char* kDefaultExtension = ".exs";

// MigrationFile is the resolved identity of one migration on disk.
// Canonical filename: "{identifier}_{name}{extension}".
struct MigrationFile {
  std::filesystem::path directory;  // NOLINT(readability-identifier-naming)
  MigrationIdentifier identifier;   // NOLINT(readability-identifier-naming)
  MigrationName name;               // NOLINT(readability-identifier-naming)
  std::string extension{kDefaultExtension};  // NOLINT(readability-identifier-naming)

  [[nodiscard]] std::string filename() const {
    return identifier.value + "_" + name.value + extension;
  }

  [[nodiscard]] std::filesystem::path path() const { return directory / filename(); }
};

}  // namespace migen::migration
