#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace x402::config {

using x402::runtime::config::RuntimeConfig;

namespace {

/*
  Every RuntimeConfig field is a string inside a named section, so the
  document must be a map of maps of scalars. Scalars are kept as written
  (`version: 2` and `version: "2"` both read as "2"); section and key
  names are checked by the protobuf JSON parser.
*/
google::protobuf::Struct SectionsFromYaml(const YAML::Node& yaml) {
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping of sections");
  }

  google::protobuf::Struct sections;
  for (const auto& section : yaml) {
    const auto name = section.first.Scalar();
    if (section.second.IsNull()) {
      continue;
    }
    if (!section.second.IsMap()) {
      throw std::runtime_error("Invalid configuration: section '" + name + "' must be a mapping");
    }

    auto* fields = (*sections.mutable_fields())[name].mutable_struct_value()->mutable_fields();
    for (const auto& entry : section.second) {
      const auto key = entry.first.Scalar();
      if (!entry.second.IsScalar()) {
        throw std::runtime_error("Invalid configuration: " + name + "." + key + " must be a scalar");
      }
      (*fields)[key].set_string_value(entry.second.Scalar());
    }
  }
  return sections;
}

RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(SectionsFromYaml(yaml), &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

} // namespace x402::config
