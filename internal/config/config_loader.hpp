#pragma once

#include <optional>
#include <string>

#include "config/config.pb.h"

namespace mountsync::config {

/*
  Loads RuntimeConfig.

  YAML is converted to JSON then parsed into protobuf. The three paths
  can be overridden from the environment (ZURGINFODIR,
  RCLONE_REMOTE_PATH, DB_FILE), which is how the container supplies
  them.
*/
class ConfigLoader {
 public:
  static mountsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // YAML (when given) + environment + defaults. Does not validate.
  static mountsync::runtime::config::RuntimeConfig Load(const std::optional<std::string>& yaml_path);

  static void ApplyEnvironment(mountsync::runtime::config::RuntimeConfig* config);
  static void ApplyDefaults(mountsync::runtime::config::RuntimeConfig* config);

  // Throws util::ConfigurationError naming the first unusable setting.
  static void Validate(const mountsync::runtime::config::RuntimeConfig& config);
};

} // namespace mountsync::config
