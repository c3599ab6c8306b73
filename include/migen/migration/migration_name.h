#pragma once

#include "migen/core/result.h"
#include "migen/migration/error.h"

#include <string>
#include <string_view>

namespace migen::migration {

// MigrationName is an accepted, normalized slug ("add_posts_table").
// Construct through make_migration_name so the slug invariant holds.
struct MigrationName {
  std::string value;
  auto operator<=>(const MigrationName&) const = default;
};

// MigrationIdentifier is the filename prefix that orders migrations.
// Generated identifiers are 14 ASCII digits (UTC YYYYMMDDHHMMSS); overrides are kept verbatim.
struct MigrationIdentifier {
  std::string value;
  auto operator<=>(const MigrationIdentifier&) const = default;
};

// make_migration_name normalizes raw to its slug form.
// Fails with kInvalidInvocation when the slug is empty (blank or punctuation-only input).
[[nodiscard]] core::Result<MigrationName, Error> make_migration_name(std::string_view raw);

// migration_module_name builds the namespace-qualified symbol used in the template:
// ("MyApp.Repo", add_posts_table) -> "MyApp.Repo.Migrations.AddPostsTable".
[[nodiscard]] std::string migration_module_name(std::string_view repo_namespace,
                                                const MigrationName& name);

}  // namespace migen::migration
