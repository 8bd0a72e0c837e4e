#include "nc-validator/Config.hpp"
#include "nc-validator/Logger.hpp"

#include <yaml-cpp/yaml.h>

namespace ncvalidator {

static void read_string(const YAML::Node &doc, const char *key,
                        std::string &out) {
  const auto node = doc[key];
  if (!node)
    return;
  if (!node.IsScalar())
    throw ConfigError(std::string("Config key '") + key +
                      "' must be a string");
  out = node.as<std::string>();
}

ValidatorConfig load_config(const std::string &yaml_path) {
  return load_config(yaml_path, ValidatorConfig{});
}

ValidatorConfig load_config(const std::string &yaml_path,
                            ValidatorConfig base) {
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(yaml_path);
  } catch (const YAML::Exception &e) {
    throw ConfigError("Failed to load config " + yaml_path + ": " + e.what());
  }

  if (doc.IsNull())
    return base;
  if (!doc.IsMap())
    throw ConfigError("Config " + yaml_path + " must be a map");

  read_string(doc, "template", base.template_path);
  read_string(doc, "log_level", base.log_level);
  read_string(doc, "log_file", base.log_file);
  read_string(doc, "json_report", base.json_report);

  for (auto it = doc.begin(); it != doc.end(); ++it) {
    if (!it->first.IsScalar())
      throw ConfigError("Config " + yaml_path + " has a non-scalar key");
    std::string key = it->first.as<std::string>();
    if (key != "template" && key != "log_level" && key != "log_file" &&
        key != "json_report") {
      LOG_WARN("CONFIG", "LOAD", "Ignoring unknown config key '{}' in {}",
               key, yaml_path);
    }
  }
  return base;
}

} // namespace ncvalidator
