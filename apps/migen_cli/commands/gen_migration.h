#pragma once

// cmd_gen_migration: parse gen.migration flags and generate a migration per repository
int cmd_gen_migration(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
