#include "nc-validator/SchemaYaml.hpp"
#include "nc-validator/Logger.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace ncvalidator {

namespace {

struct SchemaError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

std::vector<std::string> read_name_list(const YAML::Node &node,
                                        const std::string &path) {
  std::vector<std::string> names;
  if (!node)
    return names;
  if (!node.IsSequence())
    throw SchemaError(path + " must be a sequence");
  for (const auto &entry : node) {
    if (!entry.IsScalar())
      throw SchemaError(path + " entries must be names");
    names.push_back(entry.as<std::string>());
  }
  return names;
}

VariableSchema read_variable(const YAML::Node &node, const std::string &name) {
  std::string path = "variables/" + name;
  if (!node.IsMap())
    throw SchemaError(path + " must be a map");
  if (!node["type"] || !node["type"].IsScalar())
    throw SchemaError("Missing required field 'type' in " + path);

  VariableSchema var;
  std::string type_str = node["type"].as<std::string>();
  auto type = parse_data_type(type_str);
  if (!type)
    throw SchemaError("Unknown type '" + type_str + "' in " + path);
  var.datatype = *type;
  if (var.datatype == DataType::UserDefined)
    var.type_name = type_str.substr(5);

  var.dimensions = read_name_list(node["dimensions"], path + "/dimensions");
  var.attributes = read_name_list(node["attributes"], path + "/attributes");
  return var;
}

DataFile read_document(const YAML::Node &doc, const std::string &source) {
  if (!doc.IsMap())
    throw SchemaError("Schema document must be a map");

  DataFile file;
  file.source = doc["source"] ? doc["source"].as<std::string>() : source;
  file.global_attributes =
      read_name_list(doc["global_attributes"], "global_attributes");

  if (const auto dims = doc["dimensions"]) {
    if (!dims.IsMap())
      throw SchemaError("dimensions must be a map of name to size");
    for (auto it = dims.begin(); it != dims.end(); ++it) {
      file.dimensions.emplace_back(it->first.as<std::string>(),
                                   it->second.as<std::size_t>());
    }
  }

  if (const auto vars = doc["variables"]) {
    if (!vars.IsMap())
      throw SchemaError("variables must be a map");
    for (auto it = vars.begin(); it != vars.end(); ++it) {
      std::string name = it->first.as<std::string>();
      file.variables.emplace_back(name, read_variable(it->second, name));
    }
  }
  return file;
}

void emit_name_list(YAML::Emitter &out, const std::string &key,
                    const std::vector<std::string> &names) {
  out << YAML::Key << key << YAML::Value << YAML::Flow << YAML::BeginSeq;
  for (const auto &name : names)
    out << name;
  out << YAML::EndSeq;
}

} // namespace

OpenResult SchemaYaml::parse(const std::string &yaml_text,
                             const std::string &source) {
  try {
    return OpenResult::success(read_document(YAML::Load(yaml_text), source));
  } catch (const YAML::Exception &e) {
    return OpenResult::failure(OpenErrorKind::InvalidSchema, source,
                               std::string("YAML parse error: ") + e.what());
  } catch (const SchemaError &e) {
    return OpenResult::failure(OpenErrorKind::InvalidSchema, source,
                               e.what());
  }
}

OpenResult SchemaYaml::load(const std::string &yaml_path) {
  std::error_code ec;
  if (yaml_path.empty() || !std::filesystem::exists(yaml_path, ec)) {
    return OpenResult::failure(OpenErrorKind::FileNotFound, yaml_path,
                               ec ? ec.message() : "No such file");
  }
  try {
    YAML::Node doc = YAML::LoadFile(yaml_path);
    DataFile file = read_document(doc, yaml_path);
    // A schema loaded from disk is identified by its own path
    file.source = yaml_path;
    LOG_DEBUG("SCHEMA", "LOAD", "Loaded YAML schema {} ({} variables)",
              yaml_path, file.variables.size());
    return OpenResult::success(std::move(file));
  } catch (const YAML::BadFile &e) {
    return OpenResult::failure(OpenErrorKind::FileUnreadable, yaml_path,
                               e.what());
  } catch (const YAML::Exception &e) {
    return OpenResult::failure(OpenErrorKind::InvalidSchema, yaml_path,
                               std::string("YAML parse error: ") + e.what());
  } catch (const SchemaError &e) {
    return OpenResult::failure(OpenErrorKind::InvalidSchema, yaml_path,
                               e.what());
  }
}

std::string SchemaYaml::dump(const DataFile &file) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  if (!file.source.empty())
    out << YAML::Key << "source" << YAML::Value << file.source;

  emit_name_list(out, "global_attributes", file.global_attributes);

  out << YAML::Key << "dimensions" << YAML::Value << YAML::BeginMap;
  for (const auto &[name, size] : file.dimensions)
    out << YAML::Key << name << YAML::Value << size;
  out << YAML::EndMap;

  out << YAML::Key << "variables" << YAML::Value << YAML::BeginMap;
  for (const auto &[name, var] : file.variables) {
    out << YAML::Key << name << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "type" << YAML::Value << var.type_string();
    emit_name_list(out, "dimensions", var.dimensions);
    emit_name_list(out, "attributes", var.attributes);
    out << YAML::EndMap;
  }
  out << YAML::EndMap;

  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

} // namespace ncvalidator
