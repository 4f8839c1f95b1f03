#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <unistd.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>

#include "internal/store/retention.hpp"
#include "internal/util/errors.hpp"

namespace mountsync::config {

using mountsync::runtime::config::RuntimeConfig;

namespace fs = std::filesystem;

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
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::ConfigurationError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

RuntimeConfig ConfigLoader::Load(const std::optional<std::string>& yaml_path) {
  RuntimeConfig config;
  if (yaml_path) {
    config = LoadFromYaml(*yaml_path);
  }
  ApplyEnvironment(&config);
  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig* config) {
  auto* paths = config->mutable_paths();

  if (const char* info_dir = std::getenv("ZURGINFODIR"); info_dir && *info_dir) {
    paths->set_info_dir(info_dir);
  }
  if (const char* mount_root = std::getenv("RCLONE_REMOTE_PATH"); mount_root && *mount_root) {
    paths->set_mount_root(mount_root);
  }
  if (const char* db_file = std::getenv("DB_FILE"); db_file && *db_file) {
    paths->set_db_file(db_file);
  }
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* paths = config->mutable_paths();
  if (paths->db_file().empty()) paths->set_db_file("torrents.db");

  auto* mount = config->mutable_mount();
  if (mount->content_dir().empty()) mount->set_content_dir("__all__");
  if (mount->scan_timeout_ms() == 0) mount->set_scan_timeout_ms(120000);
  if (mount->scan_retries() == 0) mount->set_scan_retries(3);
  if (mount->retry_backoff_initial_ms() == 0) mount->set_retry_backoff_initial_ms(1000);
  if (mount->retry_backoff_max_ms() == 0) mount->set_retry_backoff_max_ms(30000);
  if (!mount->has_name_match_threshold()) mount->set_name_match_threshold(85);

  auto* reconcile = config->mutable_reconcile();
  if (reconcile->missing_debounce_scans() == 0) reconcile->set_missing_debounce_scans(3);
  if (reconcile->outage_pause_threshold_ms() == 0) reconcile->set_outage_pause_threshold_ms(600000);
  if (reconcile->resume_after_healthy_scans() == 0) reconcile->set_resume_after_healthy_scans(2);

  // once a day
  auto* scheduler = config->mutable_scheduler();
  if (scheduler->interval_ms() == 0) scheduler->set_interval_ms(86400000);

  auto* store = config->mutable_store();
  if (store->busy_timeout_ms() == 0) store->set_busy_timeout_ms(5000);
  if (store->removed_retention_days() == 0) store->set_removed_retention_days(30);

  auto* metadata = config->mutable_metadata();
  if (metadata->progress_log_interval_ms() == 0) metadata->set_progress_log_interval_ms(30000);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& paths = config.paths();
  std::error_code ec;

  if (paths.info_dir().empty()) {
    throw util::ConfigurationError("info directory is not set (ZURGINFODIR or paths.info_dir)");
  }
  if (!fs::is_directory(paths.info_dir(), ec)) {
    throw util::ConfigurationError("info directory does not exist: " + paths.info_dir());
  }

  if (paths.mount_root().empty()) {
    throw util::ConfigurationError("mount root is not set (RCLONE_REMOTE_PATH or paths.mount_root)");
  }
  if (!fs::is_directory(paths.mount_root(), ec)) {
    throw util::ConfigurationError("mount root does not exist: " + paths.mount_root());
  }

  if (paths.db_file().empty()) {
    throw util::ConfigurationError("database file is not set (DB_FILE or paths.db_file)");
  }
  auto db_dir = fs::path(paths.db_file()).parent_path();
  if (db_dir.empty()) {
    db_dir = ".";
  }
  if (!fs::is_directory(db_dir, ec) || ::access(db_dir.c_str(), W_OK) != 0) {
    throw util::ConfigurationError("database directory is not writable: " + db_dir.string());
  }

  const auto threshold = config.mount().name_match_threshold();
  if (threshold > 100) {
    throw util::ConfigurationError("mount.name_match_threshold must be at most 100");
  }

  if (config.store().removed_retention_days() > store::kMaxRetentionDays) {
    throw util::ConfigurationError("store.removed_retention_days must be at most " + std::to_string(store::kMaxRetentionDays));
  }
}

} // namespace mountsync::config
