#include "migen/migration/migration_name.h"

#include "migen/core/normalization.h"

namespace migen::migration {

core::Result<MigrationName, Error> make_migration_name(const std::string_view raw) {
  std::string slug = core::underscore(raw);
  if (slug.empty()) {
    return core::Result<MigrationName, Error>::err(
        Error{ErrorKind::kInvalidInvocation,
              "migration name \"" + std::string{raw} + "\" contains no letters or digits",
              {}});
  }
  return core::Result<MigrationName, Error>::ok(MigrationName{std::move(slug)});
}

std::string migration_module_name(const std::string_view repo_namespace,
                                  const MigrationName& name) {
  std::string module_name{repo_namespace};
  if (!module_name.empty()) {
    module_name += '.';
  }
  module_name += "Migrations.";
  module_name += core::camelize(name.value);
  return module_name;
}

}  // namespace migen::migration
