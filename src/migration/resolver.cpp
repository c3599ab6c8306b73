#include "migen/migration/resolver.h"

#include <algorithm>
#include <system_error>

namespace migen::migration {

namespace fs = std::filesystem;

namespace {

Error directory_unavailable(const fs::path& directory, const std::string& reason) {
  return Error{ErrorKind::kDirectoryUnavailable,
               "migrations directory " + directory.string() + " is unavailable: " + reason,
               {}};
}

Error naming_conflict(std::string_view raw_name, std::vector<std::string> conflicting_paths) {
  std::string message = "migration can't be created, there is already a migration file with name " +
                        std::string{raw_name} + ".\n";
  for (const auto& path : conflicting_paths) {
    message += "  existing: " + path + "\n";
  }
  message += "You can specify a timestamp that will override this error with `--timestamp 1234`";
  return Error{ErrorKind::kNamingConflict, std::move(message), std::move(conflicting_paths)};
}

}  // namespace

core::Result<std::vector<fs::path>, Error> MigrationResolver::find_fuzzy_matches(
    const fs::path& directory, const MigrationName& name) const {
  using MatchResult = core::Result<std::vector<fs::path>, Error>;

  const std::string suffix = "_" + name.value + extension_;
  std::vector<fs::path> matches;

  std::error_code ec;
  fs::directory_iterator it(directory, ec);
  if (ec) {
    return MatchResult::err(directory_unavailable(directory, ec.message()));
  }

  // increment(ec) leaves the iterator at end on failure, so ec is checked after the loop.
  for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
    const std::string filename = it->path().filename().string();
    // Glob '*' never matches a leading dot.
    if (filename.empty() || filename.front() == '.') {
      continue;
    }
    if (filename.size() >= suffix.size() && filename.ends_with(suffix)) {
      matches.push_back(it->path());
    }
  }
  if (ec) {
    return MatchResult::err(directory_unavailable(directory, ec.message()));
  }

  std::sort(matches.begin(), matches.end(),
            [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); });
  return MatchResult::ok(std::move(matches));
}

ResolveResult MigrationResolver::resolve(const fs::path& directory, const std::string_view name,
                                         const MigrationIdentifier& identifier) const {
  auto name_result = make_migration_name(name);
  if (!name_result.has_value()) {
    return ResolveResult::err(name_result.error());
  }

  Resolution resolution;
  resolution.file = MigrationFile{directory, identifier, name_result.value(), extension_};

  // Overrides are kept verbatim, but must name a file inside directory.
  if (identifier.value.find_first_of("/\\") != std::string::npos ||
      resolution.file.path().filename() != resolution.file.filename()) {
    return ResolveResult::err(Error{ErrorKind::kInvalidInvocation,
                                    "identifier \"" + identifier.value +
                                        "\" must not contain path separators",
                                    {}});
  }

  std::error_code ec;
  const fs::file_status dir_status = fs::status(directory, ec);
  if (dir_status.type() == fs::file_type::not_found) {
    // Nothing on disk can collide; the caller creates the directory before writing.
    resolution.directory_missing = true;
    return ResolveResult::ok(std::move(resolution));
  }
  if (ec) {
    return ResolveResult::err(directory_unavailable(directory, ec.message()));
  }
  if (!fs::is_directory(dir_status)) {
    return ResolveResult::err(directory_unavailable(directory, "not a directory"));
  }

  const fs::path candidate = resolution.file.path();
  const bool exact_exists = fs::exists(candidate, ec);
  if (ec) {
    return ResolveResult::err(directory_unavailable(directory, ec.message()));
  }
  if (exact_exists) {
    resolution.already_exists = true;
    return ResolveResult::ok(std::move(resolution));
  }

  auto matches = find_fuzzy_matches(directory, resolution.file.name);
  if (!matches.has_value()) {
    return ResolveResult::err(matches.error());
  }
  if (!matches.value().empty()) {
    std::vector<std::string> conflicting;
    conflicting.reserve(matches.value().size());
    for (const auto& path : matches.value()) {
      conflicting.push_back(path.string());
    }
    return ResolveResult::err(naming_conflict(name, std::move(conflicting)));
  }

  return ResolveResult::ok(std::move(resolution));
}

}  // namespace migen::migration
