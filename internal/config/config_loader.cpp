#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/model/pubkey.hpp"
#include "internal/util/errors.hpp"

namespace heroes::config {

using heroes::runtime::config::RuntimeConfig;

namespace {

constexpr char        kDefaultBindAddress[]   = "0.0.0.0:50051";
constexpr char        kDefaultAuthoritySeed[] = "hallofheros";
constexpr char        kDefaultRetiredName[]   = "RETIRED";
constexpr char        kDefaultRetiredUri[]    = "retired://";
constexpr uint32_t    kDefaultMaxSlots        = 20;
constexpr uint32_t    kMaxSlotsLimit          = 256;
constexpr std::size_t kMaxSeedLength          = 32;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings
  if (node.Tag() == "!") {
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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

void RequireKey(const std::string& value, const std::string& field, bool required) {
  if (value.empty()) {
    if (required) throw std::runtime_error("Invalid configuration: " + field + " is required");
    return;
  }
  try {
    model::Pubkey::FromString(value);
  } catch (const util::DataIntegrityError&) {
    throw std::runtime_error("Invalid configuration: " + field + " is not a base58 key: " + value);
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* program = config.mutable_program();
  if (program->authority_seed().empty()) program->set_authority_seed(kDefaultAuthoritySeed);
  if (program->max_slots() == 0) program->set_max_slots(kDefaultMaxSlots);
  if (program->buy_strategy() == heroes::runtime::config::BUY_STRATEGY_UNSPECIFIED) {
    program->set_buy_strategy(heroes::runtime::config::BUY_STRATEGY_TRANSFER);
  }
  if (program->retired_name().empty()) program->set_retired_name(kDefaultRetiredName);
  if (program->retired_uri().empty()) program->set_retired_uri(kDefaultRetiredUri);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& program = config.program();
  RequireKey(program.program_id(), "program.program_id", true);
  if (program.max_slots() == 0 || program.max_slots() > kMaxSlotsLimit) {
    throw std::runtime_error("Invalid configuration: program.max_slots must be in 1.." + std::to_string(kMaxSlotsLimit));
  }
  if (program.authority_seed().size() > kMaxSeedLength) {
    throw std::runtime_error("Invalid configuration: program.authority_seed exceeds " + std::to_string(kMaxSeedLength) + " bytes");
  }

  const auto& host = config.host();
  RequireKey(host.token_program_id(), "host.token_program_id", true);
  RequireKey(host.system_program_id(), "host.system_program_id", true);
  RequireKey(host.metadata_program_id(), "host.metadata_program_id", true);
  RequireKey(host.repository_account(), "host.repository_account", false);
}

} // namespace heroes::config
