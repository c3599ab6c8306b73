#include "migen/config/generator_config.h"

#include "migen/core/normalization.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace migen::config {

namespace {

using json = nlohmann::json;

migration::Error invalid(const std::string& message) {
  return migration::Error{migration::ErrorKind::kInvalidInvocation, message, {}};
}

generator::RepoTarget parse_repo(const json& entry) {
  generator::RepoTarget target;
  if (entry.is_string()) {
    target.namespace_name = core::trim(entry.get<std::string>());
  } else if (entry.is_object()) {
    target.namespace_name = core::trim(entry.at("namespace").get<std::string>());
    if (entry.contains("priv")) {
      target.priv_dir = entry.at("priv").get<std::string>();
    }
  } else {
    throw std::invalid_argument("repo entries must be strings or objects");
  }

  if (target.namespace_name.empty()) {
    throw std::invalid_argument("repo namespace must not be empty");
  }
  return target;
}

std::optional<std::string> optional_string(const json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  return j.at(key).get<std::string>();
}

}  // namespace

ConfigResult parse_generator_config(const std::string& json_text) {
  try {
    const json j = json::parse(json_text);
    if (!j.is_object()) {
      return ConfigResult::err(invalid("configuration must be a JSON object"));
    }

    GeneratorConfig config;

    if (j.contains("repos")) {
      for (const auto& entry : j.at("repos")) {
        config.repos.push_back(parse_repo(entry));
      }
    } else if (j.contains("repo")) {
      config.repos.push_back(parse_repo(j.at("repo")));
    }

    if (j.contains("extension")) {
      config.extension = j.at("extension").get<std::string>();
      if (config.extension.empty() || config.extension.front() != '.') {
        return ConfigResult::err(invalid("extension must start with '.': " + config.extension));
      }
    }

    config.name = optional_string(j, "name");
    config.timestamp = optional_string(j, "timestamp");
    config.change = optional_string(j, "change");

    return ConfigResult::ok(std::move(config));
  } catch (const json::exception& e) {
    return ConfigResult::err(invalid(std::string{"invalid configuration: "} + e.what()));
  } catch (const std::invalid_argument& e) {
    return ConfigResult::err(invalid(std::string{"invalid configuration: "} + e.what()));
  }
}

ConfigResult load_generator_config(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return ConfigResult::err(invalid("failed to open configuration file: " + path.string()));
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse_generator_config(buffer.str());
}

}  // namespace migen::config
