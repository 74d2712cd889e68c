#include "config_loader.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace piecework::config {

using google::protobuf::Descriptor;
using google::protobuf::FieldDescriptor;

static void SetScalarValue(const YAML::Node& node, const FieldDescriptor* field, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // "..." and '...' carry the non-specific tag "!"; string fields take the text as written
  if (node.Tag() == "!" || (field && field->type() == FieldDescriptor::TYPE_STRING)) {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

// field/message follow the YAML path through the config schema; both are null under unknown keys.
static void YamlToProtoValue(const YAML::Node& node, const FieldDescriptor* field, const Descriptor* message,
                             google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, field, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], field, message, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        const std::string&     key   = it.first.Scalar();
        const FieldDescriptor* child = nullptr;
        if (message) {
          child = message->FindFieldByName(key);
          if (!child) {
            for (int f = 0; f < message->field_count(); ++f) {
              if (message->field(f)->json_name() == key) {
                child = message->field(f);
                break;
              }
            }
          }
        }
        YamlToProtoValue(it.second, child, child ? child->message_type() : nullptr,
                         &(*struct_value->mutable_fields())[key]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static piecework::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  piecework::runtime::config::RuntimeConfig config;

  // empty document: all defaults
  if (!yaml || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, nullptr, piecework::runtime::config::RuntimeConfig::descriptor(), &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
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

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

piecework::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

piecework::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

} // namespace piecework::config
