#pragma once

#include "migen/core/result.h"
#include "migen/migration/error.h"
#include "migen/migration/migration_file.h"
#include "migen/migration/migration_name.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace migen::migration {

// Resolution is a successful resolve() outcome.
// directory_missing: the target directory does not exist yet; the caller must create it.
// already_exists: the exact candidate file is already on disk (idempotent re-resolution).
struct Resolution {
  MigrationFile file;              // NOLINT(readability-identifier-naming)
  bool directory_missing{false};   // NOLINT(readability-identifier-naming)
  bool already_exists{false};      // NOLINT(readability-identifier-naming)
};

using ResolveResult = core::Result<Resolution, Error>;

// MigrationResolver maps (directory, name, identifier) to a collision-free migration file.
//
// Resolution rules, evaluated against the filesystem at call time (read-only):
// 1. name is normalized to its slug; an empty slug is kInvalidInvocation. An identifier
//    containing a path separator is kInvalidInvocation.
// 2. A missing directory resolves successfully with directory_missing set.
//    A path that exists but is not a listable directory is kDirectoryUnavailable.
// 3. If directory/{identifier}_{slug}{ext} already exists the resolution succeeds.
// 4. Otherwise any file matching *_{slug}{ext} is a fuzzy collision and yields
//    kNamingConflict listing every match, sorted.
//
// There is no locking: two processes may both pass step 4 for the same name before
// either writes its file.
class MigrationResolver {
 public:
  MigrationResolver() = default;
  explicit MigrationResolver(std::string extension) : extension_(std::move(extension)) {}

  [[nodiscard]] ResolveResult resolve(const std::filesystem::path& directory,
                                      std::string_view name,
                                      const MigrationIdentifier& identifier) const;

  // find_fuzzy_matches lists files in directory whose name ends with "_{slug}{ext}".
  // Hidden files are skipped. Output is sorted by filename.
  [[nodiscard]] core::Result<std::vector<std::filesystem::path>, Error> find_fuzzy_matches(
      const std::filesystem::path& directory, const MigrationName& name) const;

  [[nodiscard]] const std::string& extension() const { return extension_; }

 private:
  std::string extension_{kDefaultExtension};
};

}  // namespace migen::migration
