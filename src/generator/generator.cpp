#include "migen/generator/generator.h"

#include "migen/core/normalization.h"
#include "migen/migration/identifier.h"
#include "migen/migration/template_renderer.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace migen::generator {

namespace fs = std::filesystem;

std::filesystem::path default_priv_dir(const std::string_view namespace_name) {
  const auto dot = namespace_name.rfind('.');
  const std::string_view last =
      dot == std::string_view::npos ? namespace_name : namespace_name.substr(dot + 1);
  return fs::path{"priv"} / core::underscore(last);
}

std::filesystem::path migrations_dir(const RepoTarget& target) {
  const fs::path priv =
      target.priv_dir.empty() ? default_priv_dir(target.namespace_name) : target.priv_dir;
  return priv / "migrations";
}

GenerateResult generate_migration(const RepoTarget& target, const GenerateRequest& request,
                                  core::IClock& clock,
                                  const migration::MigrationResolver& resolver) {
  const migration::IdentifierGenerator ids(clock);
  const auto identifier = ids.generate(request.timestamp);

  auto resolved = resolver.resolve(migrations_dir(target), request.name, identifier);
  if (!resolved.has_value()) {
    return GenerateResult::err(resolved.error());
  }

  const auto& resolution = resolved.value();

  GeneratedMigration generated;
  generated.file = resolution.file;
  generated.module_name =
      migration::migration_module_name(target.namespace_name, resolution.file.name);
  generated.contents = migration::render_migration(generated.module_name, request.change);
  generated.directory_missing = resolution.directory_missing;
  generated.already_exists = resolution.already_exists;
  return GenerateResult::ok(std::move(generated));
}

core::Result<WriteStatus, migration::Error> write_migration(const GeneratedMigration& generated) {
  using WriteResult = core::Result<WriteStatus, migration::Error>;

  const fs::path path = generated.file.path();
  const auto fail = [&path](const std::string& reason) {
    return WriteResult::err(migration::Error{migration::ErrorKind::kDirectoryUnavailable,
                                             "cannot write " + path.string() + ": " + reason,
                                             {}});
  };

  std::error_code ec;
  // create_directories returns false without error when the directory already exists.
  fs::create_directories(generated.file.directory, ec);
  if (ec) {
    return fail(ec.message());
  }

  // Checked on disk rather than through already_exists: an earlier target in the same
  // batch may have written this path after resolution.
  const bool exists = fs::exists(path, ec);
  if (ec) {
    return fail(ec.message());
  }
  if (exists) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
      return fail("failed to read existing file");
    }
    std::ostringstream existing;
    existing << in.rdbuf();
    if (existing.str() == generated.contents) {
      return WriteResult::ok(WriteStatus::kIdentical);
    }
    return WriteResult::err(
        migration::Error{migration::ErrorKind::kNamingConflict,
                         "migration " + path.string() +
                             " already exists with different contents; it was left unchanged",
                         {path.string()}});
  }

  std::ofstream out(path, std::ios::binary);
  if (!out.is_open()) {
    return fail("failed to open file");
  }
  out << generated.contents;
  out.flush();
  if (!out) {
    return fail("failed to write file");
  }

  return WriteResult::ok(WriteStatus::kCreated);
}

core::Result<std::vector<GeneratedMigration>, migration::Error> generate_for_repos(
    const std::vector<RepoTarget>& targets, const GenerateRequest& request, core::IClock& clock,
    const migration::MigrationResolver& resolver,
    const std::function<void(const GeneratedMigration&, WriteStatus)>& on_written) {
  using BatchResult = core::Result<std::vector<GeneratedMigration>, migration::Error>;

  if (targets.empty()) {
    return BatchResult::err(migration::Error{migration::ErrorKind::kInvalidInvocation,
                                             "no repository configured", {}});
  }

  std::vector<GeneratedMigration> written;
  written.reserve(targets.size());

  for (const auto& target : targets) {
    auto generated = generate_migration(target, request, clock, resolver);
    if (!generated.has_value()) {
      return BatchResult::err(generated.error());
    }

    auto write_result = write_migration(generated.value());
    if (!write_result.has_value()) {
      return BatchResult::err(write_result.error());
    }

    if (on_written) {
      on_written(generated.value(), write_result.value());
    }
    written.push_back(generated.value());
  }

  return BatchResult::ok(std::move(written));
}

}  // namespace migen::generator
