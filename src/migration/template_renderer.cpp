#include "migen/migration/template_renderer.h"

namespace migen::migration {

std::string render_migration(const std::string_view module_name,
                             const std::optional<std::string>& change_body) {
  std::string out;
  out.reserve(96 + module_name.size() + (change_body ? change_body->size() : 0));

  out += "defmodule ";
  out += module_name;
  out += " do\n";
  out += "  use Ecto.Migration\n";
  out += "  def change do\n";
  out += change_body.value_or("");
  out += "\n";
  out += "  end\n";
  out += "end\n";
  return out;
}

}  // namespace migen::migration
