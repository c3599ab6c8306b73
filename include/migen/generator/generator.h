#pragma once

#include "migen/core/clock.h"
#include "migen/core/result.h"
#include "migen/migration/error.h"
#include "migen/migration/migration_file.h"
#include "migen/migration/resolver.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace migen::generator {

// RepoTarget names one repository that receives migrations.
// An empty priv_dir means "derive from the namespace" (see default_priv_dir).
struct RepoTarget {
  std::string namespace_name;       // NOLINT(readability-identifier-naming)
  std::filesystem::path priv_dir;   // NOLINT(readability-identifier-naming)
};

// default_priv_dir derives priv/<underscored last namespace segment>:
// "MyApp.Repo" -> "priv/repo", "Billing.ReadReplica" -> "priv/read_replica".
[[nodiscard]] std::filesystem::path default_priv_dir(std::string_view namespace_name);

// migrations_dir returns <priv_dir>/migrations, deriving priv_dir when unset.
[[nodiscard]] std::filesystem::path migrations_dir(const RepoTarget& target);

struct GenerateRequest {
  std::string name;                      // NOLINT(readability-identifier-naming)
  std::optional<std::string> timestamp;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> change;     // NOLINT(readability-identifier-naming)
};

// GeneratedMigration is everything needed to materialize one migration file.
struct GeneratedMigration {
  migration::MigrationFile file;  // NOLINT(readability-identifier-naming)
  std::string module_name;        // NOLINT(readability-identifier-naming)
  std::string contents;           // NOLINT(readability-identifier-naming)
  bool directory_missing{false};  // NOLINT(readability-identifier-naming)
  bool already_exists{false};     // NOLINT(readability-identifier-naming)
};

using GenerateResult = core::Result<GeneratedMigration, migration::Error>;

// generate_migration runs identifier generation, resolution and rendering for one target.
// Pure with respect to the filesystem: it only reads the migrations directory.
[[nodiscard]] GenerateResult generate_migration(const RepoTarget& target,
                                                const GenerateRequest& request,
                                                core::IClock& clock,
                                                const migration::MigrationResolver& resolver);

enum class WriteStatus {
  kCreated,    // file written
  kIdentical,  // file already on disk with byte-identical contents; nothing written
};

// write_migration creates the migrations directory when needed and writes the contents.
// An existing file is never replaced: identical bytes yield kIdentical, different bytes
// yield kNamingConflict and leave the file untouched.
// Directory creation is idempotent. Any I/O failure is kDirectoryUnavailable.
[[nodiscard]] core::Result<WriteStatus, migration::Error> write_migration(
    const GeneratedMigration& generated);

// generate_for_repos generates and writes one migration per target, in order.
// on_written (optional) is invoked after each successful write or identical skip.
// Stops at the first error; files written for earlier targets are kept.
[[nodiscard]] core::Result<std::vector<GeneratedMigration>, migration::Error> generate_for_repos(
    const std::vector<RepoTarget>& targets, const GenerateRequest& request, core::IClock& clock,
    const migration::MigrationResolver& resolver,
    const std::function<void(const GeneratedMigration&, WriteStatus)>& on_written = {});

}  // namespace migen::generator
