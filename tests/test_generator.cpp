#include "migen/core/clock.h"
#include "migen/core/time.h"
#include "migen/generator/generator.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace migen;
namespace fs = std::filesystem;

static fs::path make_scratch_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("migen_test_generator_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static std::string read_file(const fs::path& path) {
  std::ifstream in(path);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// ── priv dir derivation ────────────────────────────────────────────────────

TEST_CASE("default_priv_dir: underscored last namespace segment", "[generator]") {
  CHECK(generator::default_priv_dir("MyApp.Repo") == fs::path{"priv/repo"});
  CHECK(generator::default_priv_dir("Billing.ReadReplica") == fs::path{"priv/read_replica"});
  CHECK(generator::default_priv_dir("Repo") == fs::path{"priv/repo"});
}

TEST_CASE("migrations_dir: explicit priv wins over derivation", "[generator]") {
  CHECK(generator::migrations_dir({"MyApp.Repo", {}}) == fs::path{"priv/repo/migrations"});
  CHECK(generator::migrations_dir({"MyApp.Repo", "db/main"}) == fs::path{"db/main/migrations"});
}

// ── single-target generation ───────────────────────────────────────────────

TEST_CASE("generate_migration: path, module and contents", "[generator]") {
  const fs::path root = make_scratch_dir("single");
  core::FixedClock clock(core::make_utc(2024, 1, 1, 12, 0, 0));
  const migration::MigrationResolver resolver;

  const generator::RepoTarget target{"MyApp.Repo", root / "priv"};
  const generator::GenerateRequest request{"add_posts_table", std::nullopt,
                                           std::string{"create table(:posts)"}};

  const auto result = generator::generate_migration(target, request, clock, resolver);
  REQUIRE(result.has_value());

  const auto& generated = result.value();
  CHECK(generated.file.path() == root / "priv" / "migrations" / "20240101120000_add_posts_table.exs");
  CHECK(generated.module_name == "MyApp.Repo.Migrations.AddPostsTable");
  CHECK(generated.contents.starts_with("defmodule MyApp.Repo.Migrations.AddPostsTable do\n"));
  CHECK(generated.contents.find("create table(:posts)") != std::string::npos);
  CHECK(generated.directory_missing);
  // Generation alone never touches the filesystem.
  CHECK_FALSE(fs::exists(generated.file.directory));

  fs::remove_all(root);
}

TEST_CASE("write_migration: creates directory and writes contents", "[generator]") {
  const fs::path root = make_scratch_dir("write");
  core::FixedClock clock(core::make_utc(2024, 1, 1, 12, 0, 0));
  const migration::MigrationResolver resolver;

  const auto generated = generator::generate_migration(
      {"MyApp.Repo", root / "priv"}, {"add_posts_table", std::nullopt, std::nullopt}, clock,
      resolver);
  REQUIRE(generated.has_value());

  const auto written = generator::write_migration(generated.value());
  REQUIRE(written.has_value());
  CHECK(written.value() == generator::WriteStatus::kCreated);
  CHECK(fs::is_directory(generated.value().file.directory));
  CHECK(read_file(generated.value().file.path()) == generated.value().contents);

  fs::remove_all(root);
}

TEST_CASE("generate_migration: rerun with a fresh clock conflicts, override succeeds",
          "[generator]") {
  const fs::path root = make_scratch_dir("rerun");
  core::FixedClock clock(core::make_utc(2023, 12, 31, 23, 59, 59));
  const migration::MigrationResolver resolver;
  const generator::RepoTarget target{"MyApp.Repo", root / "priv"};

  const auto first = generator::generate_migration(
      target, {"add_users_table", std::nullopt, std::nullopt}, clock, resolver);
  REQUIRE(first.has_value());
  REQUIRE(generator::write_migration(first.value()).has_value());

  clock.advance(std::chrono::hours{1});
  const auto fresh = generator::generate_migration(
      target, {"add_users_table", std::nullopt, std::nullopt}, clock, resolver);
  REQUIRE_FALSE(fresh.has_value());
  CHECK(fresh.error().kind == migration::ErrorKind::kNamingConflict);

  const auto forced = generator::generate_migration(
      target, {"add_users_table", std::string{"20231231235959"}, std::nullopt}, clock, resolver);
  REQUIRE(forced.has_value());
  CHECK(forced.value().already_exists);
  CHECK(forced.value().file.path() == first.value().file.path());

  fs::remove_all(root);
}

TEST_CASE("write_migration: unwritable location is directory unavailable", "[generator]") {
  const fs::path root = make_scratch_dir("blocked");
  // A regular file where the priv directory should be blocks directory creation.
  { std::ofstream(root / "priv") << "blocker"; }

  migration::MigrationFile file{root / "priv" / "migrations",
                                migration::MigrationIdentifier{"20240101120000"},
                                migration::MigrationName{"add_posts_table"}, ".exs"};
  generator::GeneratedMigration generated;
  generated.file = file;
  generated.contents = "x";
  generated.directory_missing = true;

  const auto written = generator::write_migration(generated);
  REQUIRE_FALSE(written.has_value());
  CHECK(written.error().kind == migration::ErrorKind::kDirectoryUnavailable);

  fs::remove_all(root);
}

// ── multi-target generation ────────────────────────────────────────────────

TEST_CASE("generate_for_repos: one file per repository, in order", "[generator]") {
  const fs::path root = make_scratch_dir("multi");
  core::FixedClock clock(core::make_utc(2024, 2, 29, 6, 7, 8));
  const migration::MigrationResolver resolver;

  const std::vector<generator::RepoTarget> targets{{"MyApp.Repo", root / "repo"},
                                                   {"MyApp.Analytics", root / "analytics"}};
  std::vector<std::string> observed;

  const auto result = generator::generate_for_repos(
      targets, {"create_events", std::nullopt, std::nullopt}, clock, resolver,
      [&observed](const generator::GeneratedMigration& g, generator::WriteStatus status) {
        CHECK(status == generator::WriteStatus::kCreated);
        observed.push_back(g.module_name);
      });
  REQUIRE(result.has_value());
  REQUIRE(result.value().size() == 2);

  CHECK(fs::exists(root / "repo" / "migrations" / "20240229060708_create_events.exs"));
  CHECK(fs::exists(root / "analytics" / "migrations" / "20240229060708_create_events.exs"));
  CHECK(observed == std::vector<std::string>{"MyApp.Repo.Migrations.CreateEvents",
                                             "MyApp.Analytics.Migrations.CreateEvents"});

  fs::remove_all(root);
}

TEST_CASE("generate_for_repos: stops at the first conflict", "[generator]") {
  const fs::path root = make_scratch_dir("multi_conflict");
  fs::create_directories(root / "analytics" / "migrations");
  { std::ofstream(root / "analytics" / "migrations" / "20200101000000_create_events.exs") << ""; }
  core::FixedClock clock(core::make_utc(2024, 2, 29, 6, 7, 8));
  const migration::MigrationResolver resolver;

  const std::vector<generator::RepoTarget> targets{{"MyApp.Repo", root / "repo"},
                                                   {"MyApp.Analytics", root / "analytics"},
                                                   {"MyApp.Audit", root / "audit"}};

  const auto result = generator::generate_for_repos(
      targets, {"create_events", std::nullopt, std::nullopt}, clock, resolver);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == migration::ErrorKind::kNamingConflict);
  CHECK(fs::exists(root / "repo" / "migrations" / "20240229060708_create_events.exs"));
  CHECK_FALSE(fs::exists(root / "audit"));

  fs::remove_all(root);
}

TEST_CASE("generate_for_repos: no targets is an invalid invocation", "[generator]") {
  core::FixedClock clock(core::make_utc(2024, 1, 1));
  const migration::MigrationResolver resolver;

  const auto result =
      generator::generate_for_repos({}, {"x", std::nullopt, std::nullopt}, clock, resolver);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == migration::ErrorKind::kInvalidInvocation);
}

// ── existing files are never replaced ─────────────────────────────────────

TEST_CASE("write_migration: identical existing file is skipped", "[generator]") {
  const fs::path root = make_scratch_dir("identical");
  core::FixedClock clock(core::make_utc(2024, 1, 1, 12, 0, 0));
  const migration::MigrationResolver resolver;
  const generator::RepoTarget target{"MyApp.Repo", root / "priv"};
  const generator::GenerateRequest request{"add_posts_table", std::string{"20240101120000"},
                                           std::string{"create table(:posts)"}};

  const auto first = generator::generate_migration(target, request, clock, resolver);
  REQUIRE(first.has_value());
  REQUIRE(generator::write_migration(first.value()).has_value());

  const auto again = generator::generate_migration(target, request, clock, resolver);
  REQUIRE(again.has_value());
  CHECK(again.value().already_exists);

  const auto written = generator::write_migration(again.value());
  REQUIRE(written.has_value());
  CHECK(written.value() == generator::WriteStatus::kIdentical);
  CHECK(read_file(again.value().file.path()) == first.value().contents);

  fs::remove_all(root);
}

TEST_CASE("write_migration: edited migration is kept and reported as a conflict",
          "[generator]") {
  const fs::path root = make_scratch_dir("edited");
  const fs::path dir = root / "priv" / "migrations";
  fs::create_directories(dir);
  const std::string user_body =
      "defmodule MyApp.Repo.Migrations.AddUsersTable do\n"
      "  use Ecto.Migration\n"
      "  def change do\n"
      "    create table(:users)\n"
      "  end\n"
      "end\n";
  { std::ofstream(dir / "20231231235959_add_users_table.exs") << user_body; }

  core::FixedClock clock(core::make_utc(2024, 1, 1, 12, 0, 0));
  const migration::MigrationResolver resolver;

  const auto result = generator::generate_for_repos(
      {{"MyApp.Repo", root / "priv"}},
      {"add_users_table", std::string{"20231231235959"}, std::nullopt}, clock, resolver);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == migration::ErrorKind::kNamingConflict);
  CHECK(result.error().message.find("different contents") != std::string::npos);
  CHECK(read_file(dir / "20231231235959_add_users_table.exs") == user_body);

  fs::remove_all(root);
}

TEST_CASE("generate_for_repos: repositories sharing a directory do not overwrite each other",
          "[generator]") {
  const fs::path root = make_scratch_dir("shared_dir");
  core::FixedClock clock(core::make_utc(2024, 1, 1, 12, 0, 0));
  const migration::MigrationResolver resolver;

  const std::vector<generator::RepoTarget> targets{{"MyApp.Repo", root / "repo"},
                                                   {"Other.Repo", root / "repo"}};
  int written = 0;

  const auto result = generator::generate_for_repos(
      targets, {"add_posts", std::nullopt, std::nullopt}, clock, resolver,
      [&written](const generator::GeneratedMigration&, generator::WriteStatus) { ++written; });
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == migration::ErrorKind::kNamingConflict);
  CHECK(written == 1);

  const std::string on_disk =
      read_file(root / "repo" / "migrations" / "20240101120000_add_posts.exs");
  CHECK(on_disk.starts_with("defmodule MyApp.Repo.Migrations.AddPosts do\n"));

  fs::remove_all(root);
}

TEST_CASE("generate_migration: identifier cannot leave the migrations directory", "[generator]") {
  const fs::path root = make_scratch_dir("escape");
  core::FixedClock clock(core::make_utc(2024, 1, 1));
  const migration::MigrationResolver resolver;

  const auto result = generator::generate_migration(
      {"MyApp.Repo", root / "p3"}, {"x", std::string{"../../escaped"}, std::nullopt}, clock,
      resolver);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == migration::ErrorKind::kInvalidInvocation);
  CHECK_FALSE(fs::exists(root / "escaped_x.exs"));

  fs::remove_all(root);
}
