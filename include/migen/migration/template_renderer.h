#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace migen::migration {

// render_migration produces the initial text of a migration file:
//
//   defmodule <module_name> do
//     use Ecto.Migration
//     def change do
//   <change_body>
//     end
//   end
//
// change_body is inserted verbatim (no escaping, no re-indentation). When absent the
// callback body is a single empty line for the user to fill in.
[[nodiscard]] std::string render_migration(std::string_view module_name,
                                           const std::optional<std::string>& change_body);

}  // namespace migen::migration
