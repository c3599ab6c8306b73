#include "gen_migration.h"

#include "migen/core/clock.h"

#include "gen_migration_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr const char* kSynopsis =
    "migen_cli gen.migration <name> [--repo <Namespace>]... [--priv <dir>] "
    "[--timestamp <YYYYMMDDHHMMSS>] [--change <body>] [--config <file>]";

}  // namespace

int cmd_gen_migration(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = gen_migration_options();
  auto parsed = migen::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok()) {
    migen::apps::print_usage(std::cerr, kSynopsis, options);
    return 1;
  }

  parsed.config.names = parsed.positionals;

  migen::core::SystemClock clock;
  return execute_gen_migration(parsed.config, clock, std::cout, std::cerr);
}
