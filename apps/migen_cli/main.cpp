#include "migen/core/version.h"

#include "commands/gen_migration.h"

#include <iostream>
#include <string>

namespace {

void print_help() {
  std::cout << "migen " << migen::core::kBuildVersion << "\n"
            << "Usage: migen_cli <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  gen.migration <name>  Generate a timestamped migration file\n"
            << "  version               Print the version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_help();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "gen.migration") {
    return cmd_gen_migration(argc, argv);
  }
  if (subcommand == "version" || subcommand == "--version") {
    std::cout << migen::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "help" || subcommand == "--help" || subcommand == "-h") {
    print_help();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}
