#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace registry::config {

namespace {

constexpr char     kDefaultBindAddress[]    = "0.0.0.0:50051";
constexpr char     kDefaultStorageRoot[]    = "./storage";
constexpr char     kDefaultSqlitePath[]     = "./registry.sqlite3";
constexpr uint32_t kDefaultReadChunkBytes   = 64 * 1024;
constexpr uint32_t kDefaultMaxAttempts      = 3;
constexpr int64_t  kDefaultPendingTimeoutS  = 10 * 60;
constexpr int64_t  kDefaultGcIntervalS      = 5 * 60;
constexpr int64_t  kDefaultBlobGraceS       = 60 * 60;
constexpr int32_t  kDefaultInitialBackoffNs = 50 * 1000 * 1000;
constexpr int64_t  kDefaultMaxBackoffS      = 2;

bool IsUnset(const google::protobuf::Duration& d) {
  return d.seconds() == 0 && d.nanos() == 0;
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(registry::runtime::config::RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address(kDefaultBindAddress);
  }

  auto* database = config->mutable_database();
  if (database->backend_case() == registry::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_sqlite()->set_path(kDefaultSqlitePath);
    database->mutable_sqlite()->set_wal_mode(true);
  }

  auto* storage = config->mutable_storage();
  if (storage->backend_case() == registry::runtime::config::StorageConfig::BACKEND_NOT_SET) {
    storage->mutable_disk()->set_root_path(kDefaultStorageRoot);
    storage->mutable_disk()->set_fsync(true);
  }
  if (storage->read_chunk_bytes() == 0) {
    storage->set_read_chunk_bytes(kDefaultReadChunkBytes);
  }

  auto* publish = config->mutable_publish();
  if (IsUnset(publish->pending_timeout())) {
    publish->mutable_pending_timeout()->set_seconds(kDefaultPendingTimeoutS);
  }
  if (publish->max_attempts() == 0) {
    publish->set_max_attempts(kDefaultMaxAttempts);
  }
  if (IsUnset(publish->initial_backoff())) {
    publish->mutable_initial_backoff()->set_nanos(kDefaultInitialBackoffNs);
  }
  if (IsUnset(publish->max_backoff())) {
    publish->mutable_max_backoff()->set_seconds(kDefaultMaxBackoffS);
  }

  auto* gc = config->mutable_gc();
  if (IsUnset(gc->interval())) {
    gc->mutable_interval()->set_seconds(kDefaultGcIntervalS);
  }
  if (IsUnset(gc->blob_grace_period())) {
    gc->mutable_blob_grace_period()->set_seconds(kDefaultBlobGraceS);
  }
  // deleted_retention stays zero (keep tombstones) unless configured.
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

registry::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  registry::runtime::config::RuntimeConfig config;

  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

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
  }

  ApplyDefaults(&config);
  return config;
}

} // namespace registry::config
