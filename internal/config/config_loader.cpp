#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <unordered_set>

namespace acquisition::config {

using acquisition::runtime::config::BackendConfig;
using acquisition::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings ("0001", "true")
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

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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

[[noreturn]] static void Reject(const std::string& reason) {
  throw std::runtime_error("Invalid configuration: " + reason);
}

static bool IsNegative(const google::protobuf::Duration& d) {
  return d.seconds() < 0 || d.nanos() < 0;
}

static bool IsZero(const google::protobuf::Duration& d) {
  return d.seconds() == 0 && d.nanos() == 0;
}

static void ValidateBackend(const BackendConfig& backend) {
  const auto where = "backend '" + backend.id() + "': ";

  if (backend.has_min_interval() && IsNegative(backend.min_interval())) {
    Reject(where + "min_interval must not be negative");
  }
  if (backend.credentials().has_refresh_margin() && IsNegative(backend.credentials().refresh_margin())) {
    Reject(where + "credentials.refresh_margin must not be negative");
  }

  switch (backend.delivery_case()) {
    case BackendConfig::kEncryptedStream: {
      const auto& stream = backend.encrypted_stream();
      if (stream.chunk_size() != 0 && stream.chunk_size() % 16 != 0) {
        Reject(where + "encrypted_stream.chunk_size must be a positive multiple of 16");
      }
      if (stream.key_bytes() != 0 && stream.key_bytes() != 16 && stream.key_bytes() != 24 && stream.key_bytes() != 32) {
        Reject(where + "encrypted_stream.key_bytes must be 16, 24 or 32");
      }
      if (stream.key_derivation() == acquisition::runtime::config::KEY_DERIVATION_MD5_XOR) {
        if (stream.key_bytes() != 0 && stream.key_bytes() != 16) {
          Reject(where + "md5_xor key derivation produces 16 byte keys");
        }
        if (!stream.key_seed().empty() && stream.key_seed().size() < 16) {
          Reject(where + "md5_xor key derivation needs a key_seed of at least 16 bytes");
        }
      }
      break;
    }
    case BackendConfig::kPeerTransfer: {
      const auto& peer = backend.peer_transfer();
      if (peer.has_poll_interval() && (IsNegative(peer.poll_interval()) || IsZero(peer.poll_interval()))) {
        Reject(where + "peer_transfer.poll_interval must be positive");
      }
      break;
    }
    case BackendConfig::DELIVERY_NOT_SET:
      Reject(where + "one of encrypted_stream or peer_transfer is required");
  }
}

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

  Validate(config);
  return config;
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& orchestrator = config.orchestrator();
  if (orchestrator.has_backoff_initial() && IsNegative(orchestrator.backoff_initial())) {
    Reject("orchestrator.backoff_initial must not be negative");
  }
  if (orchestrator.has_backoff_max() && IsNegative(orchestrator.backoff_max())) {
    Reject("orchestrator.backoff_max must not be negative");
  }
  if (orchestrator.backoff_multiplier() != 0 && orchestrator.backoff_multiplier() < 1.0) {
    Reject("orchestrator.backoff_multiplier must be at least 1");
  }
  if (orchestrator.has_job_timeout() && (IsNegative(orchestrator.job_timeout()) || IsZero(orchestrator.job_timeout()))) {
    Reject("orchestrator.job_timeout must be positive when set");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    Reject("database.sqlite.path is required");
  }

  std::unordered_set<std::string> seen;
  for (const auto& backend : config.backends()) {
    if (backend.id().empty()) {
      Reject("backend id must not be empty");
    }
    if (!seen.insert(backend.id()).second) {
      Reject("duplicate backend id '" + backend.id() + "'");
    }
    ValidateBackend(backend);
  }
}

} // namespace acquisition::config
