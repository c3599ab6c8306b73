#include "gen_migration_logic.h"

#include "migen/config/generator_config.h"
#include "migen/core/normalization.h"
#include "migen/generator/generator.h"
#include "migen/migration/identifier.h"
#include "migen/migration/resolver.h"

#include <string>
#include <vector>

namespace {

std::string join_args(const std::vector<std::string>& args) {
  std::string joined;
  for (const auto& arg : args) {
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += arg;
  }
  return joined;
}

int report(std::ostream& err, const migen::migration::Error& error) {
  err << "Error: " << error.message << "\n";
  return 1;
}

}  // namespace

std::vector<migen::apps::Option<GenMigrationInvocation>> gen_migration_options() {
  return {
      {"--repo", true, "Repository namespace to generate for (repeatable)",
       [](GenMigrationInvocation& c, const std::string& v) {
         c.repos.push_back(v);
         return true;
       }},
      {"-r", true, "Alias for --repo",
       [](GenMigrationInvocation& c, const std::string& v) {
         c.repos.push_back(v);
         return true;
       }},
      {"--priv", true, "Priv directory holding migrations/ (single repository only)",
       [](GenMigrationInvocation& c, const std::string& v) {
         c.priv_dir = v;
         return true;
       }},
      {"--timestamp", true, "Explicit identifier; overrides the clock and naming conflicts",
       [](GenMigrationInvocation& c, const std::string& v) {
         c.timestamp = v;
         return true;
       }},
      {"--change", true, "Body inserted verbatim into the change callback",
       [](GenMigrationInvocation& c, const std::string& v) {
         c.change = v;
         return true;
       }},
      {"--config", true, "JSON configuration file",
       [](GenMigrationInvocation& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      // Accepted for compatibility with existing invocations; generation never compiles.
      {"--no-compile", false, "Accepted and ignored",
       [](GenMigrationInvocation&, const std::string&) { return true; }},
      {"--no-deps-check", false, "Accepted and ignored",
       [](GenMigrationInvocation&, const std::string&) { return true; }},
  };
}

int execute_gen_migration(const GenMigrationInvocation& invocation, migen::core::IClock& clock,
                          std::ostream& out, std::ostream& err) {
  using migen::migration::Error;
  using migen::migration::ErrorKind;

  migen::config::GeneratorConfig config;
  if (invocation.config_path.has_value()) {
    auto loaded = migen::config::load_generator_config(invocation.config_path.value());
    if (!loaded.has_value()) {
      return report(err, loaded.error());
    }
    config = loaded.value();
  }

  // Command-line repositories replace the configured list.
  std::vector<migen::generator::RepoTarget> targets = config.repos;
  if (!invocation.repos.empty()) {
    targets.clear();
    for (const auto& raw : invocation.repos) {
      std::string ns = migen::core::trim(raw);
      if (ns.empty()) {
        return report(err, Error{ErrorKind::kInvalidInvocation,
                                 "--repo namespace must not be empty", {}});
      }
      targets.push_back({std::move(ns), {}});
    }
  }
  if (targets.empty()) {
    return report(err, Error{ErrorKind::kInvalidInvocation,
                             "no repository given; pass --repo <Namespace> or set \"repos\" in "
                             "the configuration file",
                             {}});
  }
  if (invocation.priv_dir.has_value()) {
    if (targets.size() != 1) {
      return report(err, Error{ErrorKind::kInvalidInvocation,
                               "--priv requires exactly one repository", {}});
    }
    targets.front().priv_dir = invocation.priv_dir.value();
  }

  migen::generator::GenerateRequest request;
  if (invocation.names.size() == 1) {
    request.name = invocation.names.front();
  } else if (invocation.names.empty() && config.name.has_value()) {
    request.name = config.name.value();
  } else {
    return report(err, Error{ErrorKind::kInvalidInvocation,
                             "expected gen.migration to receive the migration file name, got: \"" +
                                 join_args(invocation.names) + "\"",
                             {}});
  }

  request.timestamp = invocation.timestamp.has_value() ? invocation.timestamp : config.timestamp;
  request.change = invocation.change.has_value() ? invocation.change : config.change;

  if (request.timestamp.has_value() &&
      !migen::migration::is_canonical_identifier(request.timestamp.value())) {
    err << "Warning: timestamp \"" << request.timestamp.value()
        << "\" is not 14 digits; migration ordering may be affected\n";
  }

  const migen::migration::MigrationResolver resolver(config.extension);
  auto result = migen::generator::generate_for_repos(
      targets, request, clock, resolver,
      [&out](const migen::generator::GeneratedMigration& generated,
             const migen::generator::WriteStatus status) {
        if (generated.directory_missing) {
          out << "* creating " << generated.file.directory.string() << "\n";
        }
        out << (status == migen::generator::WriteStatus::kIdentical ? "* identical "
                                                                     : "* creating ")
            << generated.file.path().string() << "\n";
      });
  if (!result.has_value()) {
    return report(err, result.error());
  }

  return 0;
}
