#pragma once

#include "migen/core/clock.h"

#include "shared/arg_parser.h"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

// GenMigrationInvocation is the parsed gen.migration command line.
// names holds every positional argument; exactly one is expected unless the
// configuration file supplies a default name.
struct GenMigrationInvocation {
  std::vector<std::string> names;           // NOLINT(readability-identifier-naming)
  std::vector<std::string> repos;           // NOLINT(readability-identifier-naming)
  std::optional<std::string> priv_dir;      // NOLINT(readability-identifier-naming)
  std::optional<std::string> timestamp;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> change;        // NOLINT(readability-identifier-naming)
  std::optional<std::string> config_path;   // NOLINT(readability-identifier-naming)
};

// gen_migration_options is the flag table for gen.migration.
std::vector<migen::apps::Option<GenMigrationInvocation>> gen_migration_options();

// execute_gen_migration merges invocation with the optional configuration file,
// generates one migration per repository and writes it.
// Progress goes to out ("* creating <path>"), diagnostics to err.
// Returns 0 on success, 1 on any error.
int execute_gen_migration(const GenMigrationInvocation& invocation, migen::core::IClock& clock,
                          std::ostream& out, std::ostream& err);
