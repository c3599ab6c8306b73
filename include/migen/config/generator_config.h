#pragma once

#include "migen/core/result.h"
#include "migen/generator/generator.h"
#include "migen/migration/error.h"
#include "migen/migration/migration_file.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace migen::config {

// GeneratorConfig holds generator settings read from a JSON document.
// Every key is optional; CLI flags take precedence over these values.
//
// Accepted document shape:
//   {
//     "repos": ["MyApp.Repo", {"namespace": "MyApp.Other", "priv": "priv/other"}],
//     "repo": "MyApp.Repo",            // shorthand for a single-element "repos"
//     "extension": ".exs",
//     "name": "add_posts_table",
//     "timestamp": "20240101120000",
//     "change": "create table(:posts)"
//   }
struct GeneratorConfig {
  std::vector<generator::RepoTarget> repos;              // NOLINT(readability-identifier-naming)
  std::string extension{migration::kDefaultExtension};  // NOLINT(readability-identifier-naming)
  std::optional<std::string> name;                       // NOLINT(readability-identifier-naming)
  std::optional<std::string> timestamp;                  // NOLINT(readability-identifier-naming)
  std::optional<std::string> change;                     // NOLINT(readability-identifier-naming)
};

using ConfigResult = core::Result<GeneratorConfig, migration::Error>;

// parse_generator_config parses a JSON document.
// Malformed JSON, unknown value types or an empty namespace yield kInvalidInvocation.
[[nodiscard]] ConfigResult parse_generator_config(const std::string& json_text);

// load_generator_config reads and parses a JSON file.
// An unreadable file is kInvalidInvocation.
[[nodiscard]] ConfigResult load_generator_config(const std::filesystem::path& path);

}  // namespace migen::config
